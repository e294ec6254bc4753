#include "relaysave/core/command_handler.hpp"
#include "relaysave/core/config.hpp"
#include "relaysave/core/logger.hpp"
#include "relaysave/core/utils.hpp"
#include "relaysave/crypto/key_agreement.hpp"
#include "relaysave/storage/file_index.hpp"
#include "relaysave/storage/manifest.hpp"
#include "relaysave/transfer/file_fetcher.hpp"
#include <charconv>
#include <iostream>
#include <iomanip>

namespace relaysave::core {

namespace {

bool validate_owner_key(const std::string& owner_key, std::string& error) {
    crypto::PublicKey parsed{};
    auto result = crypto::key_utils::parse_public_key_hex(owner_key, parsed);
    if (!result) {
        error = "Invalid owner key: " + result.message;
        return false;
    }
    return true;
}

CommandResult from_fetch_result(const storage::FetchResult& result) {
    int code = result.error == storage::FetchError::CANCELLED ? 130 : 1;
    return CommandResult::error(std::string(storage::to_string(result.error)) + ": " + result.message, code);
}

}

network::RecordStore* CommandContext::store() {
    if (!store_) {
        auto path = utils::FileUtils::expand_home(store_path);
        auto store = std::make_unique<network::RecordStore>(path);
        if (!store->initialize()) {
            LOG_ERROR("Cannot open record store at {}", path.string());
            return nullptr;
        }
        store_ = std::move(store);
    }
    return store_.get();
}

// ImportCommandHandler Implementation
CommandResult ImportCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path input = args[1];
    if (!utils::FileUtils::exists(input)) {
        return CommandResult::error("File does not exist: " + input.string());
    }
    
    auto* store = context_.store();
    if (!store) {
        return CommandResult::error("Failed to open record store " + context_.store_path);
    }
    
    network::ImportStats stats;
    if (!store->import_file(input, stats)) {
        return CommandResult::error("Failed to read " + input.string());
    }
    
    std::cout << "Imported " << stats.imported << " records";
    if (stats.duplicates > 0) {
        std::cout << ", " << stats.duplicates << " already stored";
    }
    if (stats.skipped > 0) {
        std::cout << ", " << stats.skipped << " malformed lines skipped";
    }
    std::cout << "\nStore now holds " << store->count() << " records\n";
    
    return CommandResult::ok();
}

// ListCommandHandler Implementation
CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const auto& owner_key = args[1];
    std::string error;
    if (!validate_owner_key(owner_key, error)) {
        return CommandResult::error(error);
    }
    
    std::uint32_t page = 1;
    if (args.size() > 2) {
        const auto& text = args[2];
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), page);
        if (ec != std::errc() || ptr != text.data() + text.size() || page == 0) {
            return CommandResult::error("Invalid page number: " + text);
        }
    }
    
    auto* store = context_.store();
    if (!store) {
        return CommandResult::error("Failed to open record store " + context_.store_path);
    }
    
    storage::IndexResolver resolver(*store, network::default_endpoints());
    storage::FileIndexPage index_page;
    auto result = resolver.resolve(owner_key, page, index_page);
    if (!result) {
        return from_fetch_result(result);
    }
    
    std::cout << "Page " << page << " of " << (index_page.total_archives + 1)
              << " (" << index_page.entries.size() << " files)\n\n";
    
    for (const auto& entry : index_page.entries) {
        std::cout << "  " << entry.file_name
                  << (entry.encryption == storage::EncryptionMode::Sealed ? "  [sealed]" : "") << "\n";
        std::cout << "    Size: " << utils::StringUtils::format_bytes(entry.file_size)
                  << "  Uploaded: " << utils::TimeUtils::format_timestamp(entry.uploaded_at) << "\n";
        std::cout << "    Hash: " << entry.file_hash << "\n";
    }
    
    return CommandResult::ok();
}

// InfoCommandHandler Implementation
CommandResult InfoCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const auto& owner_key = args[1];
    const auto& content_hash = args[2];
    std::string error;
    if (!validate_owner_key(owner_key, error)) {
        return CommandResult::error(error);
    }
    
    auto* store = context_.store();
    if (!store) {
        return CommandResult::error("Failed to open record store " + context_.store_path);
    }
    
    storage::ManifestResolver resolver(*store, network::default_endpoints());
    storage::Manifest manifest;
    auto result = resolver.resolve(owner_key, content_hash, manifest);
    if (!result) {
        return from_fetch_result(result);
    }
    
    std::cout << "File: " << manifest.file_name << "\n";
    std::cout << "Hash: " << manifest.file_hash << "\n";
    std::cout << "Size: " << utils::StringUtils::format_bytes(manifest.file_size)
              << " (" << manifest.file_size << " bytes)\n";
    std::cout << "Type: " << transfer::FileFetcher::resolve_mime_type(manifest) << "\n";
    std::cout << "Chunks: " << manifest.total_chunks << " x "
              << utils::StringUtils::format_bytes(manifest.chunk_size) << "\n";
    std::cout << "Encryption: " << storage::to_wire_string(manifest.encryption) << "\n";
    std::cout << "Created: " << utils::TimeUtils::format_timestamp(manifest.created_at) << "\n";
    std::cout << "Chunk hints: " << manifest.chunks.size() << "\n";
    
    if (manifest.relays.empty()) {
        std::cout << "Relays: (default)\n";
    } else {
        std::cout << "Relays:\n";
        for (const auto& relay : manifest.relays) {
            std::cout << "  " << relay << "\n";
        }
    }
    
    return CommandResult::ok();
}

// FetchCommandHandler Implementation
CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const auto& owner_key = args[1];
    const auto& content_hash = args[2];
    std::string error;
    if (!validate_owner_key(owner_key, error)) {
        return CommandResult::error(error);
    }
    
    crypto::SecureBytes secret_key;
    if (!context_.secret_key_hex.empty()) {
        auto key_result = crypto::key_utils::parse_secret_key_hex(context_.secret_key_hex, secret_key);
        if (!key_result) {
            return CommandResult::error("Invalid secret key: " + key_result.message);
        }
    }
    
    auto* store = context_.store();
    if (!store) {
        return CommandResult::error("Failed to open record store " + context_.store_path);
    }
    
    auto& config = Config::instance();
    transfer::FileFetcher fetcher(*store, context_.chunk_cache(), network::default_endpoints(),
                                  transfer::CollectorOptions::from_config(config));
    
    transfer::FetchOptions options;
    options.secret_key = secret_key.span();
    options.verify_hashes = config.get_bool("fetch.verify_hashes", false);
    options.cancel = context_.cancel;
    options.on_progress = [](size_t fetched, size_t total) {
        std::cout << "\rFetching chunks: " << fetched << "/" << total << std::flush;
    };
    
    auto started = std::chrono::steady_clock::now();
    transfer::FetchedFile file;
    auto result = fetcher.fetch(owner_key, content_hash, options, file);
    std::cout << "\n";
    
    if (!result) {
        return from_fetch_result(result);
    }
    
    std::filesystem::path output = context_.output_path.empty()
        ? std::filesystem::path(file.file_name).filename()
        : utils::FileUtils::expand_home(context_.output_path);
    if (output.empty()) {
        output = content_hash;
    }
    
    if (!utils::FileUtils::write_binary(output, file.data)) {
        return CommandResult::error("Failed to write " + output.string());
    }
    
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    
    std::cout << "Saved " << file.file_name << " (" << file.mime_type << ", "
              << utils::StringUtils::format_bytes(file.data.size()) << ") to " << output.string()
              << " in " << utils::StringUtils::format_duration(elapsed) << "\n";
    
    LOG_INFO("Fetched {} into {}", content_hash, output.string());
    return CommandResult::ok("File fetched successfully");
}

}
