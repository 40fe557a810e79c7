#include "viewer_options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

static bool parse_number(const std::string& s, size_t& out) {
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) return false;
  try { out = static_cast<size_t>(std::stoull(s)); } catch (const std::exception&) { return false; }
  return true;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool apply_option(ViewerOptions& opts, const std::string& name, const std::string& value, std::string& msg) {
  if (name == "window") {
    size_t n = 0;
    if (!parse_number(value, n)) { msg = "set window: use set window=<lines> (0 = fit terminal)"; return false; }
    opts.window_size = n;
    return true;
  }
  if (name == "chunk") {
    size_t n = 0;
    if (!parse_number(value, n) || n == 0) { msg = "set chunk: chunk size must be a number >= 1"; return false; }
    opts.chunk_size = n;
    return true;
  }
  if (name == "follow") {
    if (value.empty() || value == "on") { opts.follow = true; return true; }
    if (value == "off") { opts.follow = false; return true; }
    msg = "set follow: use set follow on|off";
    return false;
  }
  if (name == "nofollow") { opts.follow = false; return true; }
  if (name == "poll") {
    size_t n = 0;
    if (!parse_number(value, n) || n < 10 || n > 3600000) { msg = "set poll: interval must be 10..3600000 ms"; return false; }
    opts.poll_ms = static_cast<int>(n);
    return true;
  }
  if (name == "log") {
    if (value.empty()) { msg = "set log: use set log=<path>"; return false; }
    opts.log_file = std::filesystem::path(value);
    return true;
  }
  if (name == "loglevel") {
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), value) == levels.end()) {
      msg = "set loglevel: use trace|debug|info|warn|error|critical|off";
      return false;
    }
    opts.log_level = value;
    return true;
  }
  msg = "unknown option: " + name;
  return false;
}

bool apply_rc_line(ViewerOptions& opts, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  if (cmd != "set") { msg = "unknown command: " + cmd; return false; }
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (args.empty()) { msg = "set: missing option name"; return false; }
  std::string name = args[0];
  std::string value;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    value = name.substr(eq + 1);
    name = name.substr(0, eq);
  } else if (args.size() > 1) {
    value = args[1];
  }
  return apply_option(opts, name, value, msg);
}

bool load_rc_file(const std::filesystem::path& path, ViewerOptions& opts, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::ifstream in(path);
  if (!in) { msg = "can not open rc file: " + path.string(); return false; }
  bool ok = true;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    std::string m;
    if (!apply_rc_line(opts, line, m) && ok) {
      msg = path.string() + ":" + std::to_string(lineno) + ": " + m;
      ok = false;
    }
  }
  return ok;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / LP_RC_FILE_NAME;
}

bool parse_args(int argc, char** argv, ViewerOptions& opts, std::string& msg) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto need_value = [&](const char* opt) -> const char* {
      if (i + 1 >= argc) { msg = std::string("missing value for ") + opt; return nullptr; }
      return argv[++i];
    };
    if (arg == "-h" || arg == "--help") { opts.help = true; continue; }
    if (arg == "-f") { opts.follow = true; continue; }
    if (arg == "-v") { opts.log_level = "debug"; continue; }
    if (arg == "-n" || arg == "-c" || arg == "-p" || arg == "-l") {
      const char* v = need_value(arg.c_str());
      if (!v) return false;
      const char* name = arg == "-n" ? "window" : arg == "-c" ? "chunk" : arg == "-p" ? "poll" : "log";
      if (!apply_option(opts, name, v, msg)) return false;
      continue;
    }
    if (!arg.empty() && arg[0] == '-') { msg = "unknown flag: " + arg; return false; }
    if (opts.file) { msg = "only one file can be viewed"; return false; }
    opts.file = std::filesystem::path(arg);
  }
  if (!opts.help && !opts.file) { msg = "no file given"; return false; }
  return true;
}

std::string usage(const char* argv0) {
  std::ostringstream oss;
  oss << "usage: " << argv0 << " [-n lines] [-c bytes] [-f] [-p ms] [-l logfile] [-v] <file>\n"
      << "  -n lines   lines held in memory (default: terminal height)\n"
      << "  -c bytes   bytes per read (default " << LP_DEFAULT_CHUNK_SIZE << ")\n"
      << "  -f         follow the end of the file\n"
      << "  -p ms      poll interval (default " << LP_DEFAULT_POLL_MS << ")\n"
      << "  -l file    write log messages to file\n"
      << "  -v         debug logging (needs -l)\n"
      << "options can also be set in ~/" << LP_RC_FILE_NAME << " as `set name=value`\n";
  return oss.str();
}
