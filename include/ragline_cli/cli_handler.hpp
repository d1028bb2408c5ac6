#pragma once

#include <curl/curl.h>

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ragline_cli
{

  enum class Command
  {
    KbCreate,
    KbList,
    KbDelete,
    Upload,
    Docs,
    DocDelete,
    Ask,
    Interactions,
    Interaction,
    Stats,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string kb_id;
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string file_path;
    std::string content_from;
    std::string question;
    std::optional<int> limit;
    std::optional<int> offset;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Does not touch the network
    static CliOptions parse_arguments(int argc, char *argv[]);

    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const { return api_base_url_; }

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_kb_create_command(const CliOptions &options);
    void handle_kb_list_command();
    void handle_kb_delete_command(const CliOptions &options);
    void handle_upload_command(const CliOptions &options);
    void handle_docs_command(const CliOptions &options);
    void handle_doc_delete_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_interactions_command(const CliOptions &options);
    void handle_interaction_command(const CliOptions &options);
    void handle_stats_command();

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json perform_request(const std::string &method,
                                   const std::string &endpoint,
                                   const std::string *body);

    // Helper methods
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    std::string escape(const std::string &value);
    std::string build_url(const std::string &endpoint) const;
    static std::map<std::string, std::string> parse_flags(int argc, char *argv[], int start);
    static int parse_int_flag(const std::string &flag, const std::string &value);
    static void print_query_result(const nlohmann::json &result);
    static void print_interaction(const nlohmann::json &interaction);
    static void print_help();
  };

} // namespace ragline_cli
