#include "docsplit_cli/cli_handler.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "docsplit_core/async/batch_chunker.hpp"
#include "docsplit_core/chunking/chunking_engine.hpp"
#include "docsplit_core/llm/ollama_client.hpp"
#include "docsplit_core/serialization/json.hpp"

namespace docsplit_cli {

CliHandler::CliHandler(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

size_t CliHandler::parse_size(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < 0) {
            throw CliError(flag + " expects a non-negative integer, got '" + value + "'");
        }
        return static_cast<size_t>(parsed);
    } catch (const std::logic_error&) {
        throw CliError(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) const {
    CliOptions options;
    options.command = Command::Help;
    options.position = 0;
    options.window = 200;
    options.no_enrich = false;

    if (argc < 2) {
        return options;
    }

    std::string command = argv[1];
    if (command == "chunk" || command == "c") {
        options.command = Command::Chunk;
    } else if (command == "stats" || command == "s") {
        options.command = Command::Stats;
    } else if (command == "boundary" || command == "b") {
        options.command = Command::Boundary;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'docsplit help' for usage.");
    }

    bool has_position = false;
    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--no-enrich") {
            options.no_enrich = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--file" || flag == "-f") {
            options.file_paths.push_back(value);
        } else if (flag == "--config") {
            options.config_path = value;
        } else if (flag == "--document-id" || flag == "-d") {
            options.document_id = value;
        } else if (flag == "--position" || flag == "-p") {
            options.position = parse_size(flag, value);
            has_position = true;
        } else if (flag == "--window" || flag == "-w") {
            options.window = parse_size(flag, value);
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if (options.file_paths.empty()) {
        throw CliError(command + " requires a file path. Usage: " + command + " --file <path>");
    }
    if (options.command != Command::Chunk && options.file_paths.size() > 1) {
        throw CliError(command + " accepts a single --file");
    }
    if (options.command == Command::Boundary && !has_position) {
        throw CliError("boundary requires --position <n>");
    }
    if (!options.document_id.empty() && options.file_paths.size() > 1) {
        throw CliError("--document-id cannot be used with more than one --file");
    }
    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Chunk:
            handle_chunk_command(options);
            break;
        case Command::Stats:
            handle_stats_command(options);
            break;
        case Command::Boundary:
            handle_boundary_command(options);
            break;
        case Command::Help:
            handle_help_command();
            break;
    }
}

AppConfig CliHandler::load_config(const CliOptions& options) const {
    if (options.config_path.empty()) {
        return AppConfig::from_json(nlohmann::json::object());
    }
    return AppConfig::from_file(options.config_path);
}

docsplit_core::EnrichmentClientPtr CliHandler::make_enrichment_client(const AppConfig& config,
                                                                     const CliOptions& options) const {
    if (options.no_enrich || !config.enrichment_enabled || !config.chunking.use_smart_boundaries()) {
        return nullptr;
    }
    try {
        return std::make_shared<docsplit_core::OllamaEnrichmentClient>(
            config.ollama_url, config.enrichment_model,
            std::chrono::seconds(config.enrichment_timeout_seconds));
    } catch (const docsplit_core::OllamaError& e) {
        err_ << "Warning: " << e.what() << "; continuing without enrichment" << std::endl;
        return nullptr;
    }
}

std::string CliHandler::read_file(const std::string& path) {
    std::ifstream file_stream(path, std::ios::binary);
    if (!file_stream.is_open()) {
        throw CliError("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

std::string CliHandler::document_id_for(const CliOptions& options, const std::string& path) {
    if (!options.document_id.empty()) {
        return options.document_id;
    }
    return std::filesystem::path(path).stem().string();
}

void CliHandler::handle_chunk_command(const CliOptions& options) {
    const AppConfig config = load_config(options);
    docsplit_core::ChunkingEngine engine(config.chunking, make_enrichment_client(config, options),
                                         docsplit_core::structure::StructurePatterns::markdown(),
                                         std::chrono::milliseconds(config.enrichment_delay_ms));

    if (options.file_paths.size() == 1) {
        const std::string& path = options.file_paths.front();
        const std::string content = read_file(path);
        const docsplit_core::ChunkingReport report =
            engine.chunk_document_with_report(document_id_for(options, path), content);
        err_ << "Chunked " << path << " into " << report.chunks.size() << " chunks in "
             << report.processing_time.count() << " ms" << std::endl;
        print_json(report);
        return;
    }

    std::vector<docsplit_core::async::SourceDocument> documents;
    documents.reserve(options.file_paths.size());
    for (const auto& path : options.file_paths) {
        documents.push_back({document_id_for(options, path), read_file(path)});
    }

    docsplit_core::async::BatchChunker batch(static_cast<size_t>(config.num_workers), engine);
    const std::vector<docsplit_core::async::BatchResult> results = batch.run(documents);

    nlohmann::json output = nlohmann::json::array();
    size_t failures = 0;
    for (const auto& result : results) {
        if (result.success()) {
            output.push_back(*result.report);
        } else {
            failures++;
            output.push_back({{"document_id", result.document_id}, {"error", *result.error}});
        }
    }
    err_ << "Chunked " << results.size() - failures << " of " << results.size() << " documents"
         << std::endl;
    print_json(output);
}

void CliHandler::handle_stats_command(const CliOptions& options) {
    const AppConfig config = load_config(options);
    // Statistics never need semantic fields
    docsplit_core::ChunkingEngine engine(config.chunking);

    const std::string& path = options.file_paths.front();
    const docsplit_core::ChunkingReport report =
        engine.chunk_document_with_report(document_id_for(options, path), read_file(path));

    print_json({{"document_id", report.document_id},
                {"statistics", report.statistics},
                {"warnings", report.warnings}});
}

void CliHandler::handle_boundary_command(const CliOptions& options) {
    const AppConfig config = load_config(options);
    const std::string content = read_file(options.file_paths.front());
    if (options.position > content.size()) {
        throw CliError("--position " + std::to_string(options.position) +
                       " is past the end of the document (" + std::to_string(content.size()) +
                       " bytes)");
    }

    docsplit_core::BoundaryDetector detector(docsplit_core::structure::StructurePatterns::markdown(),
                                             config.chunking.preserve_structure());
    print_json(detector.find_boundary(content, options.position, options.window));
}

void CliHandler::handle_help_command() {
    out_ << "docsplit - split long documents into overlapping, structure-aware chunks\n\n"
         << "Usage:\n"
         << "  docsplit chunk --file <path> [--file <path> ...] [--config <json>]\n"
         << "                 [--document-id <id>] [--no-enrich]\n"
         << "  docsplit stats --file <path> [--config <json>]\n"
         << "  docsplit boundary --file <path> --position <n> [--window <n>] [--config <json>]\n"
         << "  docsplit help\n\n"
         << "Chunk, stats and boundary results are written to stdout as JSON.\n";
}

void CliHandler::print_json(const nlohmann::json& value) {
    out_ << value.dump(2) << std::endl;
}

}  // namespace docsplit_cli
