#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/model/database_metadata.hpp"
#include "internal/document/value.hpp"
#include "internal/factory.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/seed/seeder.hpp"

namespace obs = practicedb::observability;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  practicedb --config <config.yaml> init\n"
            << "  practicedb --config <config.yaml> serve\n"
            << "  practicedb --config <config.yaml> stats\n"
            << "  practicedb --config <config.yaml> export <file>\n"
            << "  practicedb --config <config.yaml> import <file> [--merge]\n"
            << "  practicedb --config <config.yaml> integrity\n"
            << "  practicedb --config <config.yaml> migrate\n"
            << "  practicedb --config <config.yaml> rollback <version>\n"
            << "  practicedb --config <config.yaml> seed [--force]\n"
            << "  practicedb --config <config.yaml> sync\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static void WriteFile(const std::string& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot write " + path);
  out << contents;
}

static std::string JoinVersions(const std::vector<std::string>& versions) {
  std::string out;
  for (const auto& v : versions) out += (out.empty() ? "" : ",") + v;
  return out.empty() ? "none" : out;
}

static int Run(const std::string& cmd, const std::vector<std::string>& args, const practicedb::runtime::config::RuntimeConfig& config) {
  auto app = practicedb::factory::Build(config);

  if (cmd == "init" || cmd == "serve") {
    const auto report = practicedb::factory::Initialize(app, config);
    std::cout << "migrations=" << JoinVersions(report.migrations) << " seeded=" << report.seed.created << "\n";
    if (cmd == "init") return 0;

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    PRACTICEDB_LOG_INFO("practicedb running", {obs::BoolField("sync", app.sync->Running())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PRACTICEDB_LOG_INFO("shutting down practicedb");
    app.sync->Stop();
    return 0;
  }

  if (cmd == "stats") {
    std::cout << practicedb::document::ToJson(practicedb::db::model::ToDocument(app.engine->GetMetadata())) << "\n";
    return 0;
  }

  if (cmd == "export") {
    if (args.size() != 1) return 1;
    WriteFile(args[0], practicedb::document::ToJson(app.engine->ExportDatabase()));
    std::cout << "exported " << args[0] << "\n";
    return 0;
  }

  if (cmd == "import") {
    if (args.empty() || args.size() > 2) return 1;
    const bool merge = args.size() == 2 && args[1] == "--merge";
    if (args.size() == 2 && !merge) return 1;
    app.engine->ImportDatabase(practicedb::document::ParseDocument(ReadFile(args[0])), merge);
    std::cout << "imported " << args[0] << (merge ? " (merge)" : "") << "\n";
    return 0;
  }

  if (cmd == "integrity") {
    std::size_t issues = 0;
    for (const auto& report : app.store->RunFullIntegrityCheck()) {
      issues += report.issues.size();
      std::cout << practicedb::document::ToJson(practicedb::validation::ToDocument(report)) << "\n";
    }
    return issues == 0 ? 0 : 3;
  }

  if (cmd == "migrate") {
    practicedb::migration::MigrationRunner runner(*app.engine);
    std::cout << "applied=" << JoinVersions(runner.RunMigrations()) << " version=" << runner.CurrentVersion() << "\n";
    return 0;
  }

  if (cmd == "rollback") {
    if (args.size() != 1) return 1;
    practicedb::migration::MigrationRunner runner(*app.engine);
    std::cout << "reverted=" << JoinVersions(runner.Rollback(args[0])) << " version=" << runner.CurrentVersion() << "\n";
    return 0;
  }

  if (cmd == "seed") {
    if (args.size() > 1 || (args.size() == 1 && args[0] != "--force")) return 1;
    practicedb::seed::Seeder seeder(*app.engine);
    const auto               report = seeder.Seed(!args.empty());
    std::cout << (report.skipped ? "skipped" : "seeded=" + std::to_string(report.created)) << "\n";
    return 0;
  }

  if (cmd == "sync") {
    const auto report = app.sync->Sync();
    std::cout << "pushed=" << report.pushed << " pulled=" << report.pulled << " conflicts=" << report.conflicts << "\n";
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = practicedb::config::ConfigLoader::LoadFromYaml(config_path);

    obs::InitializeTracing(config);
    obs::InitializeLogging(config);

    rc = Run(cmd, args, config);
    if (rc == 1) Usage();
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_ERROR("fatal error", {obs::StringField("command", cmd), obs::ErrorField(e)});
    rc = 2;
  }

  obs::ShutdownLogging();
  obs::ShutdownTracing();
  return rc;
}
