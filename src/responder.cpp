#include "LanChat/responder.hpp"
#include "LanChat/log.hpp"

#include <QByteArray>
#include <QElapsedTimer>

#include <utility>

namespace {

constexpr int SHUTDOWN_GRACE_MS = 1000;

int toMsecs(std::chrono::milliseconds timeout) {
    return static_cast<int>(timeout.count());
}

}

ProcessResponder::ProcessResponder(QString program, QStringList arguments, std::chrono::milliseconds timeout)
    : program_(std::move(program)),
      arguments_(std::move(arguments)),
      timeout_(timeout) {}

ProcessResponder::~ProcessResponder() {
    shutdown();
}

bool ProcessResponder::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (process_ && process_->state() == QProcess::Running) return true;

    auto process = std::make_unique<QProcess>();
    process->setProgram(program_);
    process->setArguments(arguments_);
    process->setProcessChannelMode(QProcess::MergedChannels);
    process->start();

    if (!process->waitForStarted(toMsecs(timeout_))) {
        qCWarning(lcResponder) << "could not start" << program_ << arguments_ << ":" << process->errorString();
        return false;
    }
    process_ = std::move(process);

    std::string greeting;
    if (!readLine(greeting)) {
        qCWarning(lcResponder) << program_ << "started but sent no greeting";
        process_->kill();
        process_->waitForFinished(SHUTDOWN_GRACE_MS);
        process_.reset();
        return false;
    }

    greeting_ = greeting;
    qCInfo(lcResponder) << "responder ready:" << greeting_.c_str();
    return true;
}

void ProcessResponder::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) return;

    process_->closeWriteChannel();
    if (!process_->waitForFinished(SHUTDOWN_GRACE_MS)) {
        process_->terminate();
        if (!process_->waitForFinished(SHUTDOWN_GRACE_MS)) {
            process_->kill();
            process_->waitForFinished(SHUTDOWN_GRACE_MS);
        }
    }
    process_.reset();
    qCDebug(lcResponder) << "responder stopped";
}

bool ProcessResponder::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->state() == QProcess::Running;
}

std::string ProcessResponder::generateResponse(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_ || process_->state() != QProcess::Running) {
        return "The assistant is not available right now.";
    }

    std::string request = text;
    for (char& c : request) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    request.push_back('\n');

    if (process_->write(request.data(), static_cast<qint64>(request.size())) < 0
        || !process_->waitForBytesWritten(toMsecs(timeout_))) {
        qCWarning(lcResponder) << "could not send request:" << process_->errorString();
        return "The assistant could not be reached.";
    }

    std::string reply;
    if (!readLine(reply)) {
        qCWarning(lcResponder) << "no answer within" << timeout_.count() << "ms";
        return "The assistant did not answer in time.";
    }
    return reply;
}

bool ProcessResponder::readLine(std::string& line) {
    QElapsedTimer timer;
    timer.start();

    while (!process_->canReadLine()) {
        const qint64 remaining = timeout_.count() - timer.elapsed();
        if (remaining <= 0 || process_->state() != QProcess::Running) return false;
        process_->waitForReadyRead(static_cast<int>(remaining));
    }

    const QByteArray raw = process_->readLine();
    line = raw.trimmed().toStdString();
    return true;
}
