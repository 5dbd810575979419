// Repository: Hush
// Component: Command-Line Entry Point
// Purpose: hush --input IN --output OUT [options]
// Copyright (c) 2026 RetroVue
//
// Exit status: 0 when the output was written or the input was skipped as
// already clean; 1 on any configuration, input or external-tool error.

#include <curl/curl.h>

#include <exception>
#include <iostream>
#include <string>

#include "hush/app/AppConfig.hpp"
#include "hush/app/Pipeline.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace {

using hush::util::Logger;

// curl_global_init / curl_global_cleanup for the process lifetime.
class CurlGlobal {
 public:
  CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
  ~CurlGlobal() {
    if (ok_) curl_global_cleanup();
  }
  bool ok() const { return ok_; }

 private:
  bool ok_;
};

}  // namespace

int main(int argc, char* argv[]) {
  hush::app::CliOverrides cli;
  try {
    cli = hush::app::ParseCommandLine(argc, argv);
  } catch (const hush::ConfigError& e) {
    std::cerr << e.what() << "\n\n";
    hush::app::PrintUsage(argv[0]);
    return 1;
  }
  if (cli.help) {
    hush::app::PrintUsage(argv[0]);
    return 0;
  }

  CurlGlobal curl;
  if (!curl.ok()) {
    Logger::Error("[hush] curl_global_init failed");
    return 1;
  }

  try {
    hush::app::LoadDotEnvFile(".env");
    const hush::app::AppConfig config =
        hush::app::LoadAppConfig(cli, hush::app::ProcessEnvironment());
    Logger::SetVerbose(config.verbose);

    hush::app::Pipeline pipeline(config, hush::app::PipelineCollaborators{});
    const hush::app::PipelineOutcome outcome = pipeline.Run();
    Logger::Info(std::string("[hush] done: ") + hush::app::PipelineOutcomeName(outcome));
    return 0;
  } catch (const std::exception& e) {
    Logger::Error(std::string("[hush] ") + e.what());
    return 1;
  }
}
