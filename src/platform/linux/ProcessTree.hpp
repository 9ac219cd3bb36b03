#pragma once

#include <QtCore/QList>
#include <QtCore/QtGlobal>

namespace Attest {

class ProcessTree {
public:
    // All live descendants of pid found through /proc, children before grandchildren
    static QList<qint64> descendantsOf(qint64 pid);

    static bool isAlive(qint64 pid);

    // SIGKILLs the process group led by rootPid, then every descendant that
    // escaped the group, then rootPid itself. Returns the number of processes
    // that were signalled.
    static int killTree(qint64 rootPid);

private:
    static qint64 parentOf(qint64 pid, char* state = nullptr);
};

} // namespace Attest
