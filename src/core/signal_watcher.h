#pragma once
#include <QObject>

class QSocketNotifier;

// Turns SIGINT and SIGTERM into a Qt signal delivered on the event loop.
// The handler only writes a byte to a socket pair; everything else happens
// in the notifier slot.
class SignalWatcher : public QObject {
    Q_OBJECT
public:
    explicit SignalWatcher(QObject* parent = nullptr);
    ~SignalWatcher() override;

    bool install();

signals:
    void terminationRequested(int signalNumber);

private slots:
    void onActivated();

private:
    static void handleSignal(int signalNumber);
    static int s_fds[2];

    QSocketNotifier* m_notifier = nullptr;
};
