#pragma once

#include "cancellation.hpp"
#include "../network/record_store.hpp"
#include "../storage/chunk_cache.hpp"
#include <string>
#include <vector>
#include <memory>

namespace relaysave::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// State shared by the commands of one invocation.
class CommandContext {
public:
    std::string store_path;
    std::string output_path;
    std::string secret_key_hex;
    CancellationToken cancel;
    
    // Opens the store on first use; nullptr when it cannot be opened.
    network::RecordStore* store();
    storage::ChunkCache& chunk_cache() { return chunk_cache_; }

private:
    std::unique_ptr<network::RecordStore> store_;
    storage::ChunkCache chunk_cache_;
};

class CommandHandler {
public:
    explicit CommandHandler(CommandContext& context) : context_(context) {}
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    CommandContext& context_;
};

class ImportCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Load records into the local store"; }
    std::string get_usage() const override { return "relaysave import <records.jsonl>"; }
};

class ListCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List an owner's files"; }
    std::string get_usage() const override { return "relaysave list <owner> [page]"; }
};

class InfoCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show a file's manifest"; }
    std::string get_usage() const override { return "relaysave info <owner> <hash>"; }
};

class FetchCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download and reassemble a file"; }
    std::string get_usage() const override {
        return "relaysave [--out <path>] [--secret-key <hex>] fetch <owner> <hash>";
    }
};

}
