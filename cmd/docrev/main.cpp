#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/document_service.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/exit_code.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/time.hpp"

#ifndef DOCREV_VERSION
#define DOCREV_VERSION "0.0.0"
#endif

namespace {

using docrev::observability::IntField;
using docrev::observability::StringField;

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

void Usage() {
  std::cerr << "Usage:\n"
            << "  docrev [--config <file.yaml>] <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  create (<text> | --input-file <path>) [-o out.docx] [--author A] [--start-date T]\n"
            << "         [--min-interval S] [--max-interval S] [--mode final|suggestions|clean]\n"
            << "         [--split boundary|simple] [--title ..] [--subject ..] [--keywords ..]\n"
            << "         [--comments ..] [--total-edit-time MIN]\n"
            << "  edit-timestamp <doc> --sentence N --timestamp T [--new-revision]\n"
            << "  view-metadata <doc> [--json <path>|-]\n"
            << "  list\n"
            << "  delete <doc>\n"
            << "  sanitize <doc> [-o out] [--neutral-date T] [--author A] [--drop-content]\n"
            << "  version\n"
            << "\n"
            << "Timestamps: YYYY-MM-DD HH:MM:SS, YYYY-MM-DDTHH:MM:SS[Z], YYYY-MM-DD HH:MM,\n"
            << "            YYYY-MM-DD, YYYY/MM/DD HH:MM:SS, YYYY/MM/DD (UTC)\n";
}

/*
  Parsed subcommand arguments.

  `value_options` take the next argument; `switches` take none. Short
  aliases are expanded by the caller-supplied map.
*/
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> values;
  std::set<std::string>              switches;

  bool Has(const std::string& name) const {
    return values.count(name) != 0;
  }

  const std::string& Value(const std::string& name) const {
    return values.at(name);
  }
};

Args ParseArgs(const std::vector<std::string>& argv, size_t begin, const std::set<std::string>& value_options,
               const std::set<std::string>& switches, const std::map<std::string, std::string>& aliases = {}) {
  Args args;
  for (size_t i = begin; i < argv.size(); ++i) {
    std::string arg = argv[i];
    if (auto alias = aliases.find(arg); alias != aliases.end()) {
      arg = alias->second;
    }

    if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
      if (switches.count(arg) != 0) {
        args.switches.insert(arg);
      } else if (value_options.count(arg) != 0) {
        if (i + 1 >= argv.size()) {
          throw UsageError("option " + arg + " needs a value");
        }
        args.values[arg] = argv[++i];
      } else {
        throw UsageError("unknown option " + arg);
      }
      continue;
    }
    args.positional.push_back(arg);
  }
  return args;
}

int64_t ParseInt(const std::string& name, const std::string& value) {
  int64_t    out = 0;
  const auto end = value.data() + value.size();
  const auto res = std::from_chars(value.data(), end, out);
  if (res.ec != std::errc() || res.ptr != end) {
    throw docrev::util::InvalidArgument(name + " expects an integer, got '" + value + "'");
  }
  return out;
}

void RequirePositional(const Args& args, size_t count, const std::string& command) {
  if (args.positional.size() != count) {
    throw UsageError(command + " expects " + std::to_string(count) + " positional argument(s)");
  }
}

void PrintDocument(const docrev::db::model::DocumentRecord& record) {
  using docrev::util::FormatDisplay;

  std::cout << "Filename:  " << record.filename << "\n"
            << "Author:    " << record.author << "\n"
            << "Created:   " << FormatDisplay(record.created_at) << "\n"
            << "Modified:  " << FormatDisplay(record.last_modified) << "\n"
            << "Mode:      " << docrev::model::ToString(record.properties.mode) << "\n"
            << "Sentences: " << record.sentences.size() << "\n\n";

  for (const auto& sentence : record.sentences) {
    auto preview = sentence.text.size() > 50 ? sentence.text.substr(0, 50) + "..." : sentence.text;
    std::cout << "  [" << sentence.position << "] rev " << sentence.revision_id << "  " << FormatDisplay(sentence.created_at) << " -> "
              << FormatDisplay(sentence.modified_at) << "  " << preview << "\n";
  }
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int RunCreate(const std::vector<std::string>& argv, size_t begin, const docrev::runtime::config::RuntimeConfig& config) {
  const auto args = ParseArgs(argv, begin,
                              {"--input-file", "--output", "--author", "--start-date", "--min-interval", "--max-interval", "--mode", "--split",
                               "--title", "--subject", "--keywords", "--comments", "--total-edit-time"},
                              {}, {{"-o", "--output"}, {"-f", "--input-file"}, {"-a", "--author"}, {"-s", "--start-date"}});

  docrev::core::CreateRequest request;
  if (args.Has("--input-file")) {
    if (!args.positional.empty()) throw UsageError("create takes either <text> or --input-file, not both");
    request.text = docrev::util::ReadFile(args.Value("--input-file"));
  } else {
    RequirePositional(args, 1, "create");
    request.text = args.positional.front();
  }

  request.output = args.Has("--output") ? args.Value("--output") : "output.docx";
  if (args.Has("--author")) request.author = args.Value("--author");
  if (args.Has("--start-date")) request.start = docrev::util::ParseTimestamp(args.Value("--start-date"));
  if (args.Has("--min-interval")) request.min_interval_seconds = ParseInt("--min-interval", args.Value("--min-interval"));
  if (args.Has("--max-interval")) request.max_interval_seconds = ParseInt("--max-interval", args.Value("--max-interval"));
  if (args.Has("--mode")) request.mode = docrev::model::ParseRenderMode(args.Value("--mode"));
  if (args.Has("--split")) {
    const auto& method = args.Value("--split");
    if (method == "boundary") {
      request.split_method = docrev::text::SplitMethod::kBoundary;
    } else if (method == "simple") {
      request.split_method = docrev::text::SplitMethod::kSimple;
    } else {
      throw docrev::util::InvalidArgument("unknown split method '" + method + "'");
    }
  }

  auto& props = request.properties;
  if (args.Has("--title")) props.title = args.Value("--title");
  if (args.Has("--subject")) props.subject = args.Value("--subject");
  if (args.Has("--keywords")) props.keywords = args.Value("--keywords");
  if (args.Has("--comments")) props.comments = args.Value("--comments");
  if (args.Has("--total-edit-time")) {
    const auto minutes = ParseInt("--total-edit-time", args.Value("--total-edit-time"));
    if (minutes < 0 || minutes > UINT32_MAX) {
      throw docrev::util::InvalidArgument("--total-edit-time must be a non-negative number of minutes");
    }
    props.total_edit_time_minutes = static_cast<uint32_t>(minutes);
  }

  auto       app    = docrev::factory::Build(config);
  const auto record = app.documents->Create(request);

  std::cout << "Created " << record.filename << "\n"
            << "Sentences:  " << record.sentences.size() << "\n"
            << "Time range: " << docrev::util::FormatDisplay(record.created_at) << " -> "
            << docrev::util::FormatDisplay(record.last_modified) << "\n";
  return docrev::util::kExitOk;
}

int RunEditTimestamp(const std::vector<std::string>& argv, size_t begin, const docrev::runtime::config::RuntimeConfig& config) {
  const auto args =
      ParseArgs(argv, begin, {"--sentence", "--timestamp"}, {"--new-revision"}, {{"-n", "--sentence"}, {"-t", "--timestamp"}});
  RequirePositional(args, 1, "edit-timestamp");
  if (!args.Has("--sentence") || !args.Has("--timestamp")) {
    throw UsageError("edit-timestamp needs --sentence and --timestamp");
  }

  const auto position = ParseInt("--sentence", args.Value("--sentence"));
  if (position < 0 || position > UINT32_MAX) {
    throw docrev::util::InvalidArgument("--sentence must be a non-negative index");
  }
  const auto instant = docrev::util::ParseTimestamp(args.Value("--timestamp"));

  docrev::core::EditOptions options;
  options.new_revision = args.switches.count("--new-revision") != 0;

  auto       app      = docrev::factory::Build(config);
  const auto sentence = app.documents->EditTimestamp(args.positional.front(), static_cast<uint32_t>(position), instant, options);

  std::cout << "Sentence " << sentence.position << " modified at " << docrev::util::FormatDisplay(sentence.modified_at) << " (revision "
            << sentence.revision_id << ")\n";
  return docrev::util::kExitOk;
}

int RunViewMetadata(const std::vector<std::string>& argv, size_t begin, const docrev::runtime::config::RuntimeConfig& config) {
  const auto args = ParseArgs(argv, begin, {"--json"}, {});
  RequirePositional(args, 1, "view-metadata");

  auto app = docrev::factory::Build(config);
  if (args.Has("--json")) {
    const auto json = app.documents->DescribeJson(args.positional.front());
    if (args.Value("--json") == "-") {
      std::cout << json << "\n";
      return docrev::util::kExitOk;
    }
    docrev::util::WriteFileAtomic(args.Value("--json"), json + "\n");
    std::cerr << "Metadata exported to " << args.Value("--json") << "\n";
  }

  PrintDocument(app.documents->Get(args.positional.front()));
  return docrev::util::kExitOk;
}

int RunList(const std::vector<std::string>& argv, size_t begin, const docrev::runtime::config::RuntimeConfig& config) {
  const auto args = ParseArgs(argv, begin, {}, {});
  RequirePositional(args, 0, "list");

  auto app = docrev::factory::Build(config);
  for (const auto& record : app.documents->List()) {
    std::cout << record.id << "\t" << docrev::util::FormatDisplay(record.last_modified) << "\t" << record.sentences.size() << "\t"
              << docrev::model::ToString(record.properties.mode) << "\t" << record.filename << "\n";
  }
  return docrev::util::kExitOk;
}

int RunDelete(const std::vector<std::string>& argv, size_t begin, const docrev::runtime::config::RuntimeConfig& config) {
  const auto args = ParseArgs(argv, begin, {}, {});
  RequirePositional(args, 1, "delete");

  auto app = docrev::factory::Build(config);
  app.documents->Delete(args.positional.front());
  std::cout << "Deleted metadata for " << docrev::core::DocumentKey(args.positional.front()) << "\n";
  return docrev::util::kExitOk;
}

int RunSanitize(const std::vector<std::string>& argv, size_t begin, const docrev::runtime::config::RuntimeConfig& config) {
  const auto args = ParseArgs(argv, begin, {"--output", "--neutral-date", "--author"}, {"--drop-content"},
                              {{"-o", "--output"}, {"-a", "--author"}});
  RequirePositional(args, 1, "sanitize");

  docrev::core::SanitizeRequest request;
  request.input = args.positional.front();
  if (args.Has("--output")) request.output = args.Value("--output");
  if (args.Has("--neutral-date")) request.neutral_instant = docrev::util::ParseTimestamp(args.Value("--neutral-date"));
  if (args.Has("--author")) request.neutral_author = args.Value("--author");
  request.keep_content = args.switches.count("--drop-content") == 0;

  // Package-only: no metadata store is opened.
  const auto report = docrev::core::SanitizeFile(request, docrev::factory::BuildServiceOptions(config));

  std::cout << "Sanitized " << request.output.value_or(request.input).string() << "\n"
            << "Insertions unwrapped: " << report.unwrapped_insertions << "\n"
            << "Deletions removed:    " << report.removed_deletions << "\n"
            << "Markers removed:      " << report.removed_markers << "\n";
  return docrev::util::kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv, argv + argc);

  size_t      next = 1;
  std::string config_path;
  if (next < args.size() && args[next] == "--config") {
    if (next + 1 >= args.size()) {
      Usage();
      return docrev::util::kExitUsage;
    }
    config_path = args[next + 1];
    next += 2;
  } else if (const char* env = std::getenv("DOCREV_CONFIG")) {
    config_path = env;
  }

  if (next >= args.size()) {
    Usage();
    return docrev::util::kExitUsage;
  }
  const std::string command = args[next++];

  if (command == "version" || command == "--version") {
    std::cout << "docrev " << DOCREV_VERSION << "\n";
    return docrev::util::kExitOk;
  }
  if (command == "help" || command == "--help" || command == "-h") {
    Usage();
    return docrev::util::kExitOk;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? docrev::config::ConfigLoader::Defaults() : docrev::config::ConfigLoader::LoadFromYaml(config_path);

    docrev::observability::InitializeLogging(config);

    int rc = docrev::util::kExitUsage;
    if (command == "create") {
      rc = RunCreate(args, next, config);
    } else if (command == "edit-timestamp") {
      rc = RunEditTimestamp(args, next, config);
    } else if (command == "view-metadata") {
      rc = RunViewMetadata(args, next, config);
    } else if (command == "list") {
      rc = RunList(args, next, config);
    } else if (command == "delete") {
      rc = RunDelete(args, next, config);
    } else if (command == "sanitize") {
      rc = RunSanitize(args, next, config);
    } else {
      throw UsageError("unknown command '" + command + "'");
    }

    docrev::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << "error: " << e.what() << "\n\n";
    Usage();
    docrev::observability::ShutdownLogging();
    return docrev::util::kExitUsage;
  } catch (const std::exception& e) {
    const int rc = docrev::util::ToExitCode(e);
    DOCREV_LOG_ERROR("command failed", {StringField("command", command), StringField("kind", docrev::util::ErrorKind(e)),
                                        StringField("error", e.what()), IntField("exit_code", rc)});
    std::cerr << "error: " << e.what() << "\n";
    docrev::observability::ShutdownLogging();
    return rc;
  }
}
