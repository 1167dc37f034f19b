#pragma once

#include <QString>
#include <QStringList>

namespace vita {

class CausalCli
{
public:
    // CLI dispatcher for symptom queries, interventions, and graph upkeep.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand opens the SQLite store and renders in the chosen format.
    int runExplain(const QStringList &args);
    int runCounterfactual(const QStringList &args);
    int runInterventions(const QStringList &args);
    int runPaths(const QStringList &args);
    int runLearn(const QStringList &args);
    int runScore(const QStringList &args);
    int runPhase(const QStringList &args);
    int runIngest(const QStringList &args);
};

} // namespace vita
