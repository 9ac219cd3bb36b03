#include "ProcessTree.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QHash>
#include <QtCore/QQueue>

#include <signal.h>
#include <sys/types.h>
#include <cerrno>

namespace Attest {

qint64 ProcessTree::parentOf(qint64 pid, char* state) {
    QFile stat(QString("/proc/%1/stat").arg(pid));
    if (!stat.open(QIODevice::ReadOnly)) {
        return -1;
    }
    // Format: pid (comm) state ppid ... where comm may itself contain ") "
    const QByteArray line = stat.readAll();
    const int commEnd = line.lastIndexOf(')');
    if (commEnd < 0) {
        return -1;
    }
    const QList<QByteArray> fields = line.mid(commEnd + 2).split(' ');
    if (fields.size() < 2) {
        return -1;
    }
    if (state && !fields[0].isEmpty()) {
        *state = fields[0].at(0);
    }
    bool ok = false;
    const qint64 parent = fields[1].toLongLong(&ok);
    return ok ? parent : -1;
}

QList<qint64> ProcessTree::descendantsOf(qint64 pid) {
    QList<qint64> descendants;
#ifdef Q_OS_LINUX
    QHash<qint64, QList<qint64>> children;
    const QStringList entries = QDir("/proc").entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        bool ok = false;
        const qint64 candidate = entry.toLongLong(&ok);
        if (!ok) {
            continue;
        }
        const qint64 parent = parentOf(candidate);
        if (parent > 0) {
            children[parent].append(candidate);
        }
    }

    QQueue<qint64> pending;
    pending.enqueue(pid);
    while (!pending.isEmpty()) {
        const qint64 current = pending.dequeue();
        for (qint64 child : children.value(current)) {
            if (!descendants.contains(child)) {
                descendants.append(child);
                pending.enqueue(child);
            }
        }
    }
#else
    Q_UNUSED(pid)
#endif
    return descendants;
}

bool ProcessTree::isAlive(qint64 pid) {
    if (pid <= 0) {
        return false;
    }
#ifdef Q_OS_LINUX
    char state = '?';
    if (parentOf(pid, &state) < 0) {
        return false;
    }
    // Zombies are dead but not yet reaped by their (possibly adoptive) parent
    return state != 'Z' && state != 'X';
#else
    return ::kill(static_cast<pid_t>(pid), 0) == 0;
#endif
}

int ProcessTree::killTree(qint64 rootPid) {
    if (rootPid <= 0) {
        return 0;
    }

    // Snapshot before signalling: once the root dies its children are reparented
    const QList<qint64> descendants = descendantsOf(rootPid);
    int signalled = 0;

    if (::kill(-static_cast<pid_t>(rootPid), SIGKILL) == 0) {
        ++signalled;
    } else if (errno != ESRCH) {
        ATTEST_DEBUG("Process group {} could not be signalled: errno {}", rootPid, errno);
    }

    for (qint64 pid : descendants) {
        if (::kill(static_cast<pid_t>(pid), SIGKILL) == 0) {
            ++signalled;
        }
    }

    if (::kill(static_cast<pid_t>(rootPid), SIGKILL) == 0) {
        ++signalled;
    }

    ATTEST_INFO("Terminated process tree rooted at {} ({} descendants)", rootPid, descendants.size());
    return signalled;
}

} // namespace Attest
