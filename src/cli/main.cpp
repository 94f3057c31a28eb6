#include <QCoreApplication>
#include <QStringList>

#include "cli/NudgeCli.hpp"
#include "common/logging.hpp"
#include "common/nudge_version.hpp"
#include "engine/engine_config.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationVersion(QStringLiteral(NUDGE_VERSION));

    nudge::EngineConfig config = nudge::loadEngineConfig();
    nudge::applyCommandLine(config, QCoreApplication::arguments());
    nudge::logging::initLogging(nudge::loggingOptionsFor(config, QStringLiteral("nudge-cli")));

    NLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              nudge::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", argc}, {"version", NUDGE_VERSION}}));

    // NudgeCli resolves the configuration again for its own dispatch.
    nudge::NudgeCli cli;
    return cli.run(argc, argv);
}
