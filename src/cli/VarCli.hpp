#pragma once

#include <QString>
#include <QStringList>

namespace cascade {

class CascadeStore;
class VariableManager;

class VarCli
{
public:
    // CLI dispatcher for reading and writing variables.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Writes go to the store only; no rule is triggered from here.
    int runGet(VariableManager &variables, const QStringList &args);
    int runSet(VariableManager &variables, const QStringList &args);
    int runList(const CascadeStore &store, VariableManager &variables);
};

} // namespace cascade
