#include "signal_watcher.h"
#include "log_manager.h"
#include <QSocketNotifier>

#ifdef Q_OS_UNIX
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>
#endif

int SignalWatcher::s_fds[2] = {-1, -1};

SignalWatcher::SignalWatcher(QObject* parent)
    : QObject(parent)
{
}

SignalWatcher::~SignalWatcher()
{
#ifdef Q_OS_UNIX
    if (m_notifier) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        ::close(s_fds[0]);
        ::close(s_fds[1]);
        s_fds[0] = s_fds[1] = -1;
    }
#endif
}

bool SignalWatcher::install()
{
#ifdef Q_OS_UNIX
    if (m_notifier)
        return true;

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_fds) != 0) {
        LOG_ERROR(QStringLiteral("SignalWatcher: socketpair failed"));
        return false;
    }

    m_notifier = new QSocketNotifier(s_fds[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &SignalWatcher::onActivated);

    struct sigaction action = {};
    action.sa_handler = &SignalWatcher::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_ERROR(QStringLiteral("SignalWatcher: sigaction failed"));
        return false;
    }
    return true;
#else
    return false;
#endif
}

void SignalWatcher::handleSignal(int signalNumber)
{
#ifdef Q_OS_UNIX
    const char byte = static_cast<char>(signalNumber);
    [[maybe_unused]] const ssize_t written = ::write(s_fds[0], &byte, sizeof(byte));
#else
    Q_UNUSED(signalNumber);
#endif
}

void SignalWatcher::onActivated()
{
#ifdef Q_OS_UNIX
    m_notifier->setEnabled(false);
    char byte = 0;
    if (::read(s_fds[1], &byte, sizeof(byte)) == sizeof(byte)) {
        LOG_INFO(QStringLiteral("Received signal %1, shutting down").arg(static_cast<int>(byte)));
        emit terminationRequested(static_cast<int>(byte));
    }
    m_notifier->setEnabled(true);
#endif
}
