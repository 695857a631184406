// top100/tools/top100/command_args.cpp - Command line argument parsing
#include "command_args.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace top100
{

namespace
{

/// Non-negative decimal that fits in `T`
template <typename T>
std::optional<T> parse_count(const std::string & text)
{
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) == 0) {
    return std::nullopt;
  }
  try {
    size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (used != text.size()) return std::nullopt;
    if (value > std::numeric_limits<T>::max()) return std::nullopt;
    return static_cast<T>(value);
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

bool takes_value(const std::string & arg)
{
  return arg == "-n" || arg == "--limit" || arg == "-j" || arg == "--jobs" || arg == "--ext" ||
         arg == "--statements" || arg == "--format" || arg == "--config";
}

}  // namespace

CommandArgs parse_args(const std::vector<std::string> & args)
{
  CommandArgs out;

  if (args.empty()) {
    out.show_help = true;
    return out;
  }

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string & arg = args[i];

    if (takes_value(arg) && i + 1 >= args.size()) {
      out.error = "missing value for " + arg;
      return out;
    }

    if (arg == "-n" || arg == "--limit") {
      const std::string & value = args[++i];
      out.limit = parse_count<size_t>(value);
      if (!out.limit) {
        out.error = "invalid limit: " + value;
        return out;
      }
    } else if (arg == "-j" || arg == "--jobs") {
      const std::string & value = args[++i];
      out.jobs = parse_count<unsigned>(value);
      if (!out.jobs) {
        out.error = "invalid job count: " + value;
        return out;
      }
    } else if (arg == "--ext") {
      std::string ext = args[++i];
      if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
      out.extensions.push_back(ext);
    } else if (arg == "--statements") {
      const std::string & value = args[++i];
      out.statements = parse_statement_set(value);
      if (!out.statements) {
        out.error = "invalid statement set: " + value + " (simple | all)";
        return out;
      }
    } else if (arg == "--format") {
      const std::string & value = args[++i];
      out.format = parse_report_format(value);
      if (!out.format) {
        out.error = "invalid format: " + value + " (text | json)";
        return out;
      }
    } else if (arg == "--config") {
      out.config_path = args[++i];
    } else if (arg == "-r" || arg == "--recursive") {
      out.recursive = true;
    } else if (arg == "--keep-error-files") {
      out.keep_error_files = true;
    } else if (arg == "-v" || arg == "--verbose") {
      out.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      out.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      out.error = "unknown option: " + arg;
      return out;
    } else {
      out.positional.push_back(arg);
    }
  }

  return out;
}

}  // namespace top100
