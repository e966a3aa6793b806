/**
 * @file main.cpp
 * @brief largeobj CLI — Linux one-shot runner around largeobj::UploadService.
 *
 * Responsibilities:
 *  - Parse subcommands and global options (CLI11).
 *  - Resolve the state directory (XDG config, ~/.config/largeobj) and open the
 *    JSON file registry inside it.
 *  - Treat every invocation as a restart: post_upgrade() on start, run one
 *    subcommand, pre_upgrade() + flush() on exit.
 *  - With --events, drain the service's event log to stderr.
 *
 * Notes:
 *  - Object ids: 1..32 chars of a–z 0–9 . - _ ; no --object means the default object.
 *  - Only the owner of the state directory may run commands against it (guard).
 *  - Exit codes: 0 ok, 1 assembly error, 2 usage / file error, 3 state error.
 *  - State file: <state-dir>/state.json, see registry.hpp FILE FORMAT.
 */

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include <sys/stat.h>
#include <unistd.h> // isatty, geteuid

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "largeobj/upload_service.hpp"
#include "largeobj/chunk_splitter.hpp"
#include "largeobj/registry.hpp"
#include "largeobj/events.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace largeobj;

// ---------- exit codes ----------

static constexpr int EXIT_ASSEMBLY = 1;
static constexpr int EXIT_USAGE    = 2;
static constexpr int EXIT_STATE    = 3;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }
static bool is_tty_stderr() { return ::isatty(fileno(stderr)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

// Object id rules: a–z 0–9 . - _ ; 1..OBJECT_ID_MAX; must start alnum.
static bool valid_object_id(const std::string& id) {
  if (id.empty() || id.size() > OBJECT_ID_MAX) return false;
  auto is_alnum = [](char c){ return (c>='a'&&c<='z') || (c>='0'&&c<='9'); };
  for (char c: id) {
    if (!(is_alnum(c) || c=='.' || c=='-' || c=='_')) return false;
  }
  return is_alnum(id.front());
}

static fs::path default_state_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "largeobj";
  const char* home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) / ".config" : fs::current_path();
  return base / "largeobj";
}

// Missing dir counts as owned: it will be created by this user.
static bool owns_state_dir(const fs::path& dir) {
  struct stat st{};
  if (::stat(dir.c_str(), &st) != 0) return true;
  return st.st_uid == ::geteuid();
}

static bool read_file(const std::string& path, Bytes& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  Bytes tmp((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return false;
  out.swap(tmp);
  return true;
}

// "-" or empty path → stdout.
static bool write_file(const std::string& path, const Bytes& bytes) {
  if (path.empty() || path == "-") {
    if (bytes.empty()) return true;
    size_t n = std::fwrite(bytes.data(), 1, bytes.size(), stdout);
    return n == bytes.size() && std::fflush(stdout) == 0;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  return static_cast<bool>(out);
}

static std::string format_ordinals(const OrdinalList& list) {
  std::string s = "[";
  for (size_t i = 0; i < list.size(); ++i) {
    if (i) s += ", ";
    s += std::to_string(list[i]);
  }
  s += "]";
  return s;
}

static std::string object_label(const ObjectId& id) {
  return id.empty() ? std::string("(default)") : std::string(id.c_str());
}

static int report_error(const Ansi& ansi, const std::string& what) {
  std::cerr << ansi.red("error: " + what) << "\n";
  return EXIT_ASSEMBLY;
}

static void drain_events(EventLog& log, const Ansi& ansi) {
  Event ev;
  while (log.get_event(ev)) {
    std::string line = std::string("[") + to_string(ev.level) + "] " + ev.name.c_str() + ": " + ev.text.c_str();
    if (ev.level == EventLevel::Info) std::cerr << ansi.dim(line) << "\n";
    else                              std::cerr << ansi.red(line) << "\n";
  }
  if (log.dropped() > 0) {
    std::cerr << ansi.dim("(" + std::to_string(log.dropped()) + " older events dropped)") << "\n";
  }
}

static void print_status_pretty(const ObjectId& id, const Status& st,
                                const std::vector<ObjectId>& objects, const Ansi& ansi) {
  std::cout << "Object: " << ansi.bold(object_label(id)) << "\n";
  std::cout << to_string(st) << "\n";
  std::cout << ansi.dim("Objects held: " + std::to_string(objects.size())) << "\n";
}

static void print_status_json(const ObjectId& id, const Status& st,
                              const std::vector<ObjectId>& objects) {
  json j;
  j["object"] = std::string(id.c_str());
  j["buffered_byte_count"] = st.buffered_byte_count;
  j["pending_chunk_count"] = st.pending_chunk_count;
  j["pending_byte_count"]  = st.pending_byte_count;
  j["pending_ordinals"]    = st.pending_ordinals;
  json objs = json::array();
  for (const auto& o: objects) objs.push_back(std::string(o.c_str()));
  j["objects"] = objs;
  std::cout << j.dump(2) << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  // Global options
  std::string opt_state_dir;
  std::string opt_object;
  bool opt_no_color = false;
  bool opt_discard_corrupt = false;
  bool opt_events = false;

  // Subcommand arguments
  std::string arg_file;
  std::string arg_out;
  std::string arg_format = "pretty";
  uint32_t    arg_ordinal = 0;
  uint32_t    arg_count = 0;
  size_t      arg_chunk_size = CHUNK_SIZE_DEFAULT;
  bool        arg_parallel = false;
  bool        arg_reverse = false;

  CLI::App app{"largeobj CLI: assemble large objects from chunks"};
  app.require_subcommand(1);

  app.add_option("--state-dir", opt_state_dir, "Override state directory");
  app.add_option("--object", opt_object, "Object id (default object when omitted)");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--discard-corrupt", opt_discard_corrupt, "Start empty instead of failing on corrupt saved state");
  app.add_flag("--events", opt_events, "Print recorded events to stderr");

  auto* cmd_append = app.add_subcommand("append", "Append a file's bytes to the sequential buffer");
  cmd_append->add_option("file", arg_file, "Input file")->required()->check(CLI::ExistingFile);

  auto* cmd_put = app.add_subcommand("put", "Store a file as the parallel chunk <ordinal>");
  cmd_put->add_option("ordinal", arg_ordinal, "Chunk ordinal")->required();
  cmd_put->add_option("file", arg_file, "Chunk file")->required()->check(CLI::ExistingFile);

  auto* cmd_upload = app.add_subcommand("upload", "Split a file into chunks and submit them all");
  cmd_upload->add_option("file", arg_file, "Input file")->required()->check(CLI::ExistingFile);
  cmd_upload->add_option("--chunk-size", arg_chunk_size, "Bytes per chunk")->capture_default_str()->check(CLI::PositiveNumber);
  auto* flag_parallel = cmd_upload->add_flag("--parallel", arg_parallel, "Submit as ordinal-tagged parallel chunks");
  cmd_upload->add_flag("--reverse", arg_reverse, "Submit parallel chunks last-first")->needs(flag_parallel);

  auto* cmd_drop = app.add_subcommand("drop", "Remove the parallel chunk <ordinal>");
  cmd_drop->add_option("ordinal", arg_ordinal, "Chunk ordinal")->required();

  auto* cmd_missing = app.add_subcommand("missing", "List ordinals in [0, n) not yet received");
  cmd_missing->add_option("n", arg_count, "Expected chunk count")->required();

  auto* cmd_complete = app.add_subcommand("complete", "Exit 0 if chunks [0, n) are all present");
  cmd_complete->add_option("n", arg_count, "Expected chunk count")->required();

  auto* cmd_consolidate = app.add_subcommand("consolidate", "Merge chunks [0, n) into the buffer");
  cmd_consolidate->add_option("n", arg_count, "Expected chunk count")->required();

  auto* cmd_finalize = app.add_subcommand("finalize", "Read and clear the buffer");
  cmd_finalize->add_option("-o,--output", arg_out, "Output file ('-' for stdout)");

  auto* cmd_status = app.add_subcommand("status", "Show buffer and pending chunk occupancy");
  cmd_status->add_option("--format", arg_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));

  auto* cmd_reset = app.add_subcommand("reset", "Discard buffer and pending chunks");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && arg_format=="pretty";
  Ansi ansi_err;
  ansi_err.enabled = !opt_no_color && is_tty_stderr();

  if (!opt_object.empty() && !valid_object_id(opt_object)) {
    std::cerr << ansi_err.red("error: invalid object id for --object\n");
    return EXIT_USAGE;
  }
  ObjectId object(opt_object.c_str());

  try {
    // Resolve state dir and open the registry
    fs::path state_dir = opt_state_dir.empty() ? default_state_dir() : fs::path(opt_state_dir);
    FileRegistry reg((state_dir / "state.json").string());
    if (!reg.load()) {
      std::cerr << ansi_err.red("error: unreadable state file: " + reg.path()) << "\n";
      return EXIT_STATE;
    }

    const bool owner = owns_state_dir(state_dir);
    EventLog log;
    UploadService svc([owner]{ return owner; }, &log);

    // Restart boundary: restore
    AssemblyError restored = svc.post_upgrade(reg, opt_discard_corrupt);
    if (!ok(restored)) {
      if (opt_events) drain_events(log, ansi_err);
      std::cerr << ansi_err.red(std::string("error: saved state rejected (") + to_string(restored)
                                + "); rerun with --discard-corrupt to start over") << "\n";
      return EXIT_STATE;
    }

    int rc = 0;
    bool dirty = true;   // read-only commands skip the write-back

    if (cmd_append->parsed()) {
      Bytes data;
      if (!read_file(arg_file, data)) {
        std::cerr << ansi_err.red("error: cannot read " + arg_file) << "\n";
        return EXIT_USAGE;
      }
      AssemblyError err = svc.append_chunk(object, data);
      if (!ok(err)) rc = report_error(ansi_err, to_string(err));
      else std::cout << "appended " << data.size() << " bytes\n";

    } else if (cmd_put->parsed()) {
      Bytes data;
      if (!read_file(arg_file, data)) {
        std::cerr << ansi_err.red("error: cannot read " + arg_file) << "\n";
        return EXIT_USAGE;
      }
      AssemblyError err = svc.append_parallel_chunk(object, arg_ordinal, data);
      if (!ok(err)) rc = report_error(ansi_err, to_string(err));
      else std::cout << "stored chunk " << arg_ordinal << " (" << data.size() << " bytes)\n";

    } else if (cmd_upload->parsed()) {
      Bytes data;
      if (!read_file(arg_file, data)) {
        std::cerr << ansi_err.red("error: cannot read " + arg_file) << "\n";
        return EXIT_USAGE;
      }
      ChunkSplitter splitter(data, arg_chunk_size);
      if (splitter.error == 3) {
        std::cerr << ansi_err.red("error: --chunk-size too small, more than " + std::to_string(UINT32_MAX) + " chunks") << "\n";
        return EXIT_USAGE;
      }
      std::vector<ChunkView> views;
      ChunkView v;
      while (splitter.next(v)) views.push_back(v);
      if (arg_reverse) std::reverse(views.begin(), views.end());

      AssemblyError err = AssemblyError::None;
      for (const auto& cv: views) {
        err = arg_parallel ? svc.append_parallel_chunk(object, cv.ordinal, cv.to_bytes())
                           : svc.append_chunk(object, cv.to_bytes());
        if (!ok(err)) break;
      }
      if (!ok(err)) {
        rc = report_error(ansi_err, to_string(err));
      } else {
        std::cout << "submitted " << views.size() << " chunk(s), " << data.size() << " bytes\n";
        if (arg_parallel) {
          std::cout << ansi.dim("next: consolidate " + std::to_string(splitter.count())) << "\n";
        }
      }

    } else if (cmd_drop->parsed()) {
      bool removed = false;
      AssemblyError err = svc.remove_parallel_chunk(object, arg_ordinal, removed);
      if (!ok(err)) rc = report_error(ansi_err, to_string(err));
      else std::cout << (removed ? "removed chunk " : "no chunk ") << arg_ordinal << "\n";

    } else if (cmd_missing->parsed()) {
      dirty = false;
      OrdinalList list;
      AssemblyError err = svc.missing(object, arg_count, list);
      if (!ok(err)) rc = report_error(ansi_err, to_string(err));
      else std::cout << format_ordinals(list) << "\n";

    } else if (cmd_complete->parsed()) {
      dirty = false;
      bool complete = false;
      AssemblyError err = svc.is_complete(object, arg_count, complete);
      if (!ok(err)) {
        rc = report_error(ansi_err, to_string(err));
      } else {
        std::cout << (complete ? "complete" : "incomplete") << "\n";
        if (!complete) rc = EXIT_ASSEMBLY;
      }

    } else if (cmd_consolidate->parsed()) {
      ConsolidateResult res = svc.consolidate(object, arg_count);
      if (res.error == AssemblyError::IncompleteUpload) {
        rc = report_error(ansi_err, std::string(to_string(res.error)) + ", missing " + format_ordinals(res.missing));
      } else if (res.error == AssemblyError::UnexpectedChunks) {
        rc = report_error(ansi_err, std::string(to_string(res.error)) + ", stray " + format_ordinals(res.unexpected));
      } else if (!res.ok()) {
        rc = report_error(ansi_err, to_string(res.error));
      } else {
        std::cout << "consolidated " << arg_count << " chunk(s), " << res.byte_count << " bytes\n";
      }

    } else if (cmd_finalize->parsed()) {
      Bytes out;
      AssemblyError err = svc.finalize(object, out);
      if (!ok(err)) {
        rc = report_error(ansi_err, to_string(err));
      } else if (!write_file(arg_out, out)) {
        // The buffer is already cleared in memory; keep the saved copy.
        std::cerr << ansi_err.red("error: cannot write " + (arg_out.empty() ? std::string("stdout") : arg_out)) << "\n";
        return EXIT_USAGE;
      } else if (!arg_out.empty() && arg_out != "-") {
        std::cout << "wrote " << out.size() << " bytes to " << arg_out << "\n";
      }

    } else if (cmd_status->parsed()) {
      dirty = false;
      Status st;
      AssemblyError err = svc.status(object, st);
      if (!ok(err)) rc = report_error(ansi_err, to_string(err));
      else if (arg_format == "json") print_status_json(object, st, svc.objects());
      else print_status_pretty(object, st, svc.objects(), ansi);

    } else if (cmd_reset->parsed()) {
      AssemblyError err = svc.reset(object);
      if (!ok(err)) rc = report_error(ansi_err, to_string(err));
      else std::cout << "reset " << object_label(object) << "\n";
    }

    // Restart boundary: save
    if (dirty || opt_discard_corrupt) {
      svc.pre_upgrade(reg);
      if (!reg.flush()) {
        if (opt_events) drain_events(log, ansi_err);
        std::cerr << ansi_err.red("error: cannot write state file: " + reg.path()) << "\n";
        return EXIT_STATE;
      }
    }

    if (opt_events) drain_events(log, ansi_err);
    return rc;

  } catch (const std::exception& e) {
    std::cerr << ansi_err.red(std::string("error: ") + e.what()) << "\n";
    return EXIT_STATE;
  }
}
