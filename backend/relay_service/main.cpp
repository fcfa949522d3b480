#include "application/transcode_pipeline.hpp"
#include "common/config/config.hpp"
#include "common/logging/logger.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/blob_client.hpp"
#include "infrastructure/managed_identity_credential.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "interface/rest_api_handler.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <format>
#include <iostream>
#include <thread>
#include <vector>

int main() {
  try {
    const auto& cfg = config::Config::getInstance();
    common::Logger::init(cfg.getLogLevel());

    const auto& transcoder_cfg = cfg.getTranscoder();
    auto transfer_service = std::make_shared<relay_service::BlobClient>(cfg.getStorage());
    auto credential_provider = std::make_shared<relay_service::ManagedIdentityCredential>(cfg.getIdentity());
    auto transcoding_service = std::make_shared<relay_service::SubprocessTranscoder>(
      std::chrono::duration_cast<std::chrono::milliseconds>(transcoder_cfg.timeout));

    auto pipeline = std::make_shared<relay_service::TranscodePipeline>(
      transfer_service,
      credential_provider,
      transcoding_service,
      relay_service::BinaryResolver::withDefaultCandidates(transcoder_cfg.binary_name,
                                                           transcoder_cfg.deployment_dir),
      relay_service::PipelineOptions{
        .work_dir = cfg.getWorkDir(),
        .output_object_name = cfg.getStorage().output_object_name
      });

    const auto& http_cfg = cfg.getHttpService();
    boost::asio::io_context ioc{static_cast<int>(http_cfg.threads)};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_cfg.host),
      static_cast<unsigned short>(http_cfg.port)
    };

    auto api_handler = std::make_shared<relay_service::RestApiHandler>(pipeline);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        common::Logger::info(std::format("Received signal {}, draining in-flight requests", signal_number));
        // run() returns once open sessions finish or hit their I/O timeout
        http_server.stop();
      }
    });

    common::Logger::info(std::format("HTTP Server listening on {} ({} threads)",
                                     cfg.getListenAddress(), http_cfg.threads));
    http_server.run();

    std::vector<std::jthread> workers;
    workers.reserve(http_cfg.threads - 1);
    for (unsigned int i = 1; i < http_cfg.threads; ++i) {
      workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
