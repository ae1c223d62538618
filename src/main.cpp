#include <QCoreApplication>
#include <QTextStream>
#include "network/SubscriptionNodeSource.h"
#include "services/relay/RelayPipeline.h"
#include "storage/ConfigIO.h"
#include "storage/RelaySettings.h"
#include "utils/Logger.h"

namespace {
void printUsage() {
  QTextStream out(stdout);
  out << "Usage: sing-box-relay --config <config.json> --settings <relay.json>\n"
         "                      [--output <out.json>] [--report <report.json>]\n"
         "                      [--log-dir <dir>] [--verbose]\n";
}
}  // namespace

int main(int argc, char* argv[]) {
  QCoreApplication app(argc, argv);
  app.setApplicationName("sing-box-relay");
  app.setApplicationVersion("1.0.0");

  QString           configPath;
  QString           settingsPath;
  QString           outputPath;
  QString           reportPath;
  QString           logDir;
  bool              verbose = false;
  const QStringList args    = app.arguments();
  for (int i = 1; i < args.size(); ++i) {
    const QString& arg     = args[i];
    const bool     hasNext = i + 1 < args.size();
    if (arg == "--config" && hasNext) {
      configPath = args[++i];
    } else if (arg == "--settings" && hasNext) {
      settingsPath = args[++i];
    } else if (arg == "--output" && hasNext) {
      outputPath = args[++i];
    } else if (arg == "--report" && hasNext) {
      reportPath = args[++i];
    } else if (arg == "--log-dir" && hasNext) {
      logDir = args[++i];
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage();
      return 0;
    } else {
      printUsage();
      return 2;
    }
  }
  if (configPath.isEmpty() || settingsPath.isEmpty()) {
    printUsage();
    return 2;
  }

  RelaySettings settings;
  QString       error;
  if (!settings.load(settingsPath, &error)) {
    Logger::error(error);
    return 1;
  }
  Logger& logger = Logger::instance();
  logger.setLevel(verbose ? Logger::Level::Debug : Logger::parseLevel(settings.logLevel()));
  logger.init(logDir.isEmpty() ? settings.logDir() : logDir);
  Logger::info("Relay merge starting...");

  error.clear();
  QJsonObject config = ConfigIO::loadConfig(configPath, &error);
  if (!error.isEmpty()) {
    Logger::error(error);
    return 1;
  }

  SubscriptionNodeSource nodeSource(settings.subscriptionDir(), settings.requestTimeoutMs());
  RelayPipeline          pipeline(settings, &nodeSource);
  const RelayReport      report = pipeline.run(config);
  report.logSummary();

  if (!ConfigIO::saveConfig(outputPath.isEmpty() ? configPath : outputPath, config, &error)) {
    Logger::error(error);
    return 1;
  }
  if (!reportPath.isEmpty() && !ConfigIO::saveJson(reportPath, report.toJson(), &error)) {
    Logger::error(error);
    return 1;
  }
  Logger::info("Relay merge finished");
  logger.close();
  return 0;
}
