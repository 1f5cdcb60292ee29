#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "cli/tacet_batch.h"
#include "cli/tacet_json_codec.h"
#include "cli/tacet_settings.h"
#include "redaction/tacet_redaction_engine.h"
#include "util/logger.h"

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitRedactionFailed = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "\n"
            << "Reads a JSON redaction request from --input (default: stdin) and\n"
            << "prints the JSON result to stdout.\n"
            << "\n"
            << "Options:\n"
            << "  --input FILE           Read the request from FILE\n"
            << "  --batch                Treat input as JSON lines, one request per line\n"
            << "  --threads N            Worker threads for --batch (default: CPU count)\n"
            << "  --config FILE          JSON settings file\n"
            << "  --min-length N         Minimum text length in characters (default: 10)\n"
            << "  --max-length N         Maximum text length in characters (default: 20000)\n"
            << "  --context-window N     Tokens examined around a candidate (default: 3)\n"
            << "  --log-level LEVEL      debug, info, warn or error (default: info)\n"
            << "  --log-file FILE        Append log lines to FILE\n"
            << "  --pretty               Indent single-request output\n"
            << "  --verbose, -v          Same as --log-level debug\n"
            << "  --help, -h             Show this help\n"
            << "\n"
            << "Environment:\n"
            << "  TACET_LOG_LEVEL, TACET_LOG_FILE, TACET_MIN_TEXT_LENGTH,\n"
            << "  TACET_MAX_TEXT_LENGTH, TACET_CONTEXT_WINDOW\n"
            << "\n"
            << "Example:\n"
            << "  echo '{\"text\": \"Call John Smith at 555-123-4567\", \"mode\": \"mask\"}' | "
            << program << "\n";
}

// Flags given on the command line; applied last so they win over env and file
struct CommandLine {
  std::string config_path;
  std::string input_path;
  bool batch = false;
  bool pretty = false;
  bool has_threads = false;
  bool has_min_length = false;
  bool has_max_length = false;
  bool has_context_window = false;
  bool has_log_level = false;
  bool has_log_file = false;
  size_t threads = 0;
  size_t min_length = 0;
  size_t max_length = 0;
  size_t context_window = 0;
  TacetLogger::Level log_level = TacetLogger::INFO;
  std::string log_file;
};

bool ParseSizeFlag(const char* flag, const char* value, size_t* out) {
  if (!Tacet::Settings::ParseSize(value, out)) {
    std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
    return false;
  }
  return true;
}

bool ReadAll(std::istream& in, std::string* out) {
  std::stringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return !in.bad();
}

}  // namespace

int main(int argc, char* argv[]) {
  CommandLine cli;

  // Parse arguments
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return kExitOk;
    } else if (strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
      cli.input_path = argv[++i];
    } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      cli.config_path = argv[++i];
    } else if (strcmp(argv[i], "--batch") == 0) {
      cli.batch = true;
    } else if (strcmp(argv[i], "--pretty") == 0) {
      cli.pretty = true;
    } else if (strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
      if (!ParseSizeFlag(argv[i], argv[i + 1], &cli.threads)) return kExitUsage;
      cli.has_threads = true;
      ++i;
    } else if (strcmp(argv[i], "--min-length") == 0 && i + 1 < argc) {
      if (!ParseSizeFlag(argv[i], argv[i + 1], &cli.min_length)) return kExitUsage;
      cli.has_min_length = true;
      ++i;
    } else if (strcmp(argv[i], "--max-length") == 0 && i + 1 < argc) {
      if (!ParseSizeFlag(argv[i], argv[i + 1], &cli.max_length)) return kExitUsage;
      cli.has_max_length = true;
      ++i;
    } else if (strcmp(argv[i], "--context-window") == 0 && i + 1 < argc) {
      if (!ParseSizeFlag(argv[i], argv[i + 1], &cli.context_window)) return kExitUsage;
      cli.has_context_window = true;
      ++i;
    } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
      if (!TacetLogger::Logger::ParseLevel(argv[++i], &cli.log_level)) {
        std::cerr << "Invalid log level: " << argv[i] << std::endl;
        return kExitUsage;
      }
      cli.has_log_level = true;
    } else if (strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
      cli.log_file = argv[++i];
      cli.has_log_file = true;
    } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
      cli.log_level = TacetLogger::DEBUG;
      cli.has_log_level = true;
    } else {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return kExitUsage;
    }
  }

  // Settings: defaults < config file < environment < command line
  Tacet::Settings settings;
  std::string error;
  if (!cli.config_path.empty() && !settings.LoadFile(cli.config_path, &error)) {
    std::cerr << error << std::endl;
    return kExitUsage;
  }
  if (!settings.ApplyEnvironment(&error)) {
    std::cerr << error << std::endl;
    return kExitUsage;
  }
  if (cli.has_threads) settings.threads = cli.threads;
  if (cli.has_min_length) settings.engine.min_text_length = cli.min_length;
  if (cli.has_max_length) settings.engine.max_text_length = cli.max_length;
  if (cli.has_context_window) settings.engine.context_window_tokens = cli.context_window;
  if (cli.has_log_level) settings.log_level = cli.log_level;
  if (cli.has_log_file) settings.log_file = cli.log_file;

  if (!settings.Validate(&error)) {
    std::cerr << "Invalid settings: " << error << std::endl;
    return kExitUsage;
  }

  TacetLogger::Logger::Init(settings.log_level, settings.log_file);
  LOG_DEBUG("Main", std::string("log_level=") + TacetLogger::Logger::LevelName(settings.log_level) +
            " max_text_length=" + std::to_string(settings.engine.max_text_length) +
            " context_window=" + std::to_string(settings.engine.context_window_tokens));

  std::ifstream input_file;
  if (!cli.input_path.empty()) {
    input_file.open(cli.input_path);
    if (!input_file.is_open()) {
      LOG_ERROR("Main", "Cannot open input file: " + cli.input_path);
      return kExitUsage;
    }
  }
  std::istream& input = cli.input_path.empty() ? std::cin : input_file;

  const Tacet::RedactionEngine engine(settings.engine);

  if (cli.batch) {
    Tacet::BatchProcessor batch(engine, settings.threads);
    size_t failures = batch.ProcessStream(input, std::cout);
    return failures == 0 ? kExitOk : kExitRedactionFailed;
  }

  std::string document;
  if (!ReadAll(input, &document)) {
    LOG_ERROR("Main", "Failed to read input");
    return kExitUsage;
  }

  Tacet::json response = Tacet::BatchProcessor::ProcessDocument(engine, document);
  if (cli.pretty) {
    std::cout << response.dump(2, ' ', false, Tacet::json::error_handler_t::replace) << std::endl;
  } else {
    std::cout << Tacet::BatchProcessor::Serialize(response) << std::endl;
  }

  return response.value("success", false) ? kExitOk : kExitRedactionFailed;
}
