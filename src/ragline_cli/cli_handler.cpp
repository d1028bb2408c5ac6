#include "ragline_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ragline_cli {

namespace {

// Long and short spellings of every flag, mapped to the long one
const std::map<std::string, std::string> &flag_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"--kb", "--kb"},           {"-k", "--kb"},
        {"--id", "--id"},           {"-i", "--id"},
        {"--name", "--name"},       {"-n", "--name"},
        {"--description", "--description"}, {"-d", "--description"},
        {"--file", "--file"},       {"-f", "--file"},
        {"--content-from", "--content-from"}, {"-c", "--content-from"},
        {"--question", "--question"}, {"-q", "--question"},
        {"--limit", "--limit"},     {"-l", "--limit"},
        {"--offset", "--offset"},   {"-o", "--offset"},
    };
    return aliases;
}

std::string require_flag(const std::map<std::string, std::string> &flags,
                         const std::string &flag,
                         const std::string &usage) {
    auto it = flags.find(flag);
    if (it == flags.end() || it->second.empty()) {
        throw CliError("Missing " + flag + ". Usage: " + usage);
    }
    return it->second;
}

std::string optional_flag(const std::map<std::string, std::string> &flags, const std::string &flag) {
    auto it = flags.find(flag);
    return it == flags.end() ? "" : it->second;
}

}  // namespace

CliHandler::CliHandler(const std::string &api_base_url)
    : api_base_url_(api_base_url), curl_handle_(curl_easy_init()) {
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
    userp->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

std::map<std::string, std::string> CliHandler::parse_flags(int argc, char *argv[], int start) {
    std::map<std::string, std::string> flags;
    for (int i = start; i < argc; i += 2) {
        std::string flag = argv[i];
        auto alias = flag_aliases().find(flag);
        if (alias == flag_aliases().end()) {
            throw CliError("Unknown option: " + flag);
        }
        if (i + 1 >= argc) {
            throw CliError("Option " + flag + " requires a value");
        }
        flags[alias->second] = argv[i + 1];
    }
    return flags;
}

int CliHandler::parse_int_flag(const std::string &flag, const std::string &value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError(flag + " must be an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::invalid_argument &) {
        throw CliError(flag + " must be an integer, got '" + value + "'");
    } catch (const std::out_of_range &) {
        throw CliError(flag + " is out of range: " + value);
    }
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
    CliOptions options;
    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    const std::string command = argv[1];
    if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    }

    const auto flags = parse_flags(argc, argv, 2);

    if (command == "kb-create") {
        options.command = Command::KbCreate;
        options.name = require_flag(flags, "--name", "kb-create --name <name> [--description <text>]");
        if (flags.count("--description")) {
            options.description = flags.at("--description");
        }
    } else if (command == "kb-list") {
        options.command = Command::KbList;
    } else if (command == "kb-delete") {
        options.command = Command::KbDelete;
        options.kb_id = require_flag(flags, "--id", "kb-delete --id <kb_id>");
    } else if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        const std::string usage = "upload --kb <kb_id> (--file <server_path> | --content-from <local_path>)";
        options.kb_id = require_flag(flags, "--kb", usage);
        options.file_path = optional_flag(flags, "--file");
        options.content_from = optional_flag(flags, "--content-from");
        if (options.file_path.empty() == options.content_from.empty()) {
            throw CliError("Give exactly one of --file or --content-from. Usage: " + usage);
        }
    } else if (command == "docs") {
        options.command = Command::Docs;
        options.kb_id = require_flag(flags, "--kb", "docs --kb <kb_id>");
    } else if (command == "doc-delete") {
        options.command = Command::DocDelete;
        const std::string usage = "doc-delete --kb <kb_id> --id <document_id>";
        options.kb_id = require_flag(flags, "--kb", usage);
        options.id = require_flag(flags, "--id", usage);
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        const std::string usage = "ask --kb <kb_id> --question <text>";
        options.kb_id = require_flag(flags, "--kb", usage);
        options.question = require_flag(flags, "--question", usage);
    } else if (command == "interactions") {
        options.command = Command::Interactions;
        options.kb_id = optional_flag(flags, "--kb");
        if (flags.count("--limit")) {
            options.limit = parse_int_flag("--limit", flags.at("--limit"));
        }
        if (flags.count("--offset")) {
            options.offset = parse_int_flag("--offset", flags.at("--offset"));
        }
    } else if (command == "interaction") {
        options.command = Command::Interaction;
        options.id = require_flag(flags, "--id", "interaction --id <interaction_id>");
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions &options) {
    switch (options.command) {
        case Command::KbCreate:
            handle_kb_create_command(options);
            break;
        case Command::KbList:
            handle_kb_list_command();
            break;
        case Command::KbDelete:
            handle_kb_delete_command(options);
            break;
        case Command::Upload:
            handle_upload_command(options);
            break;
        case Command::Docs:
            handle_docs_command(options);
            break;
        case Command::DocDelete:
            handle_doc_delete_command(options);
            break;
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Interactions:
            handle_interactions_command(options);
            break;
        case Command::Interaction:
            handle_interaction_command(options);
            break;
        case Command::Stats:
            handle_stats_command();
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_kb_create_command(const CliOptions &options) {
    nlohmann::json body;
    body["name"] = options.name;
    if (options.description) {
        body["description"] = *options.description;
    }
    nlohmann::json response = make_post_request("/api/v1/knowledge-bases", body);
    const auto &kb = response["data"];
    std::cout << "Created knowledge base " << kb.value("name", "") << std::endl;
    std::cout << "  id: " << kb.value("id", "") << std::endl;
}

void CliHandler::handle_kb_list_command() {
    nlohmann::json response = make_get_request("/api/v1/knowledge-bases");
    const auto &items = response["data"]["knowledge_bases"];
    if (items.empty()) {
        std::cout << "No knowledge bases." << std::endl;
        return;
    }
    for (const auto &kb : items) {
        std::cout << kb.value("id", "") << "  " << kb.value("name", "");
        if (kb.contains("description") && kb["description"].is_string()) {
            std::cout << "  - " << kb["description"].get<std::string>();
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_kb_delete_command(const CliOptions &options) {
    make_delete_request("/api/v1/knowledge-bases/" + escape(options.kb_id));
    std::cout << "Deleted knowledge base " << options.kb_id << std::endl;
}

void CliHandler::handle_upload_command(const CliOptions &options) {
    nlohmann::json body;
    if (!options.file_path.empty()) {
        body["file_path"] = options.file_path;
    } else {
        std::ifstream file_stream(options.content_from, std::ios::binary);
        if (!file_stream.is_open()) {
            throw CliError("Could not open file: " + options.content_from);
        }
        std::stringstream buffer;
        buffer << file_stream.rdbuf();
        const auto slash = options.content_from.find_last_of('/');
        body["filename"] = slash == std::string::npos ? options.content_from
                                                      : options.content_from.substr(slash + 1);
        body["content"] = buffer.str();
    }

    nlohmann::json response =
        make_post_request("/api/v1/knowledge-bases/" + escape(options.kb_id) + "/documents", body);
    const auto &document = response["data"];
    std::cout << "Indexed " << document.value("filename", "") << " ("
              << document.value("chunks_count", 0) << " chunks)" << std::endl;
    std::cout << "  id: " << document.value("id", "") << std::endl;
}

void CliHandler::handle_docs_command(const CliOptions &options) {
    nlohmann::json response =
        make_get_request("/api/v1/knowledge-bases/" + escape(options.kb_id) + "/documents");
    const auto &items = response["data"]["documents"];
    if (items.empty()) {
        std::cout << "No documents." << std::endl;
        return;
    }
    for (const auto &document : items) {
        std::cout << document.value("id", "") << "  " << std::left << std::setw(10)
                  << document.value("status", "") << std::right << std::setw(6)
                  << document.value("chunks_count", 0) << "  " << document.value("filename", "")
                  << std::endl;
    }
}

void CliHandler::handle_doc_delete_command(const CliOptions &options) {
    make_delete_request("/api/v1/knowledge-bases/" + escape(options.kb_id) + "/documents/" +
                        escape(options.id));
    std::cout << "Deleted document " << options.id << std::endl;
}

void CliHandler::handle_ask_command(const CliOptions &options) {
    nlohmann::json body;
    body["knowledge_base_id"] = options.kb_id;
    body["question"] = options.question;
    nlohmann::json response = make_post_request("/api/v1/query", body);
    print_query_result(response["data"]);
}

void CliHandler::handle_interactions_command(const CliOptions &options) {
    std::string endpoint = "/api/v1/interactions";
    std::string separator = "?";
    if (!options.kb_id.empty()) {
        endpoint += separator + "kb_id=" + escape(options.kb_id);
        separator = "&";
    }
    if (options.limit) {
        endpoint += separator + "limit=" + std::to_string(*options.limit);
        separator = "&";
    }
    if (options.offset) {
        endpoint += separator + "offset=" + std::to_string(*options.offset);
    }

    nlohmann::json response = make_get_request(endpoint);
    const auto &items = response["data"]["interactions"];
    if (items.empty()) {
        std::cout << "No interactions." << std::endl;
        return;
    }
    for (const auto &interaction : items) {
        std::cout << interaction.value("created_at", "") << "  " << std::left << std::setw(9)
                  << interaction.value("status", "") << std::right << interaction.value("id", "")
                  << "  " << interaction.value("question", "") << std::endl;
    }
}

void CliHandler::handle_interaction_command(const CliOptions &options) {
    nlohmann::json response = make_get_request("/api/v1/interactions/" + escape(options.id));
    print_interaction(response["data"]);
}

void CliHandler::handle_stats_command() {
    nlohmann::json response = make_get_request("/api/v1/dashboard/stats");
    const auto &stats = response["data"];
    std::cout << "Knowledge bases:    " << stats.value("knowledge_base_count", 0) << std::endl;
    std::cout << "Documents:          " << stats.value("document_count", 0) << std::endl;
    std::cout << "Interactions:       " << stats.value("total_interactions", 0) << std::endl;
    std::cout << "  answered:         " << stats.value("answered_count", 0) << std::endl;
    std::cout << "  unknown:          " << stats.value("unknown_count", 0) << std::endl;
    std::cout << "  error:            " << stats.value("error_count", 0) << std::endl;
}

void CliHandler::print_query_result(const nlohmann::json &result) {
    const std::string status = result.value("status", "");
    std::cout << "Status: " << status << std::endl;
    if (result.contains("answer") && result["answer"].is_string()) {
        std::cout << std::endl << result["answer"].get<std::string>() << std::endl;
    }
    if (result.contains("citations") && !result["citations"].empty()) {
        std::cout << std::endl << "Sources:" << std::endl;
        for (const auto &citation : result["citations"]) {
            std::cout << "  - " << citation.value("source_document", "");
            if (citation.contains("page") && citation["page"].is_number_integer()) {
                std::cout << " (page " << citation["page"].get<int>() << ")";
            }
            std::cout << std::endl;
        }
    }
    std::cout << std::endl << "Interaction: " << result.value("interaction_id", "") << std::endl;
}

void CliHandler::print_interaction(const nlohmann::json &interaction) {
    std::cout << "Interaction " << interaction.value("id", "") << std::endl;
    std::cout << "  knowledge base: " << interaction.value("knowledge_base_id", "") << std::endl;
    std::cout << "  created:        " << interaction.value("created_at", "") << std::endl;
    std::cout << "  question:       " << interaction.value("question", "") << std::endl;
    nlohmann::json as_result = interaction;
    as_result["interaction_id"] = interaction.value("id", "");
    print_query_result(as_result);
}

void CliHandler::print_help() {
    std::cout << "ragline CLI - grounded question answering over your documents\n\n"
              << "Usage: ragline_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  kb-create     --name <name> [--description <text>]\n"
              << "  kb-list\n"
              << "  kb-delete     --id <kb_id>\n"
              << "  upload, u     --kb <kb_id> (--file <server_path> | --content-from <local_path>)\n"
              << "  docs          --kb <kb_id>\n"
              << "  doc-delete    --kb <kb_id> --id <document_id>\n"
              << "  ask, a        --kb <kb_id> --question <text>\n"
              << "  interactions  [--kb <kb_id>] [--limit <n>] [--offset <n>]\n"
              << "  interaction   --id <interaction_id>\n"
              << "  stats\n"
              << "  help, h\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  server address (default http://127.0.0.1:8000)\n";
}

std::string CliHandler::escape(const std::string &value) {
    char *escaped = curl_easy_escape(curl_handle_, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode '" + value + "'");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string CliHandler::build_url(const std::string &endpoint) const {
    std::string base = api_base_url_;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
    return perform_request("GET", endpoint, nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint, const nlohmann::json &data) {
    const std::string body = data.dump();
    return perform_request("POST", endpoint, &body);
}

nlohmann::json CliHandler::make_delete_request(const std::string &endpoint) {
    return perform_request("DELETE", endpoint, nullptr);
}

nlohmann::json CliHandler::perform_request(const std::string &method,
                                           const std::string &endpoint,
                                           const std::string *body) {
    const std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    struct curl_slist *headers = nullptr;
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error &) {
        throw CliError("Server returned HTTP " + std::to_string(http_code) + " with a non-JSON body");
    }

    if (http_code < 200 || http_code >= 300) {
        throw CliError("HTTP " + std::to_string(http_code) + ": " +
                       response.value("error", std::string("request failed")));
    }
    return response;
}

}  // namespace ragline_cli
