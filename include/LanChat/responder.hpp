#ifndef LANCHAT_RESPONDER_HPP
#define LANCHAT_RESPONDER_HPP

#include <QProcess>
#include <QStringList>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

class ResponseGenerator {
public:
    virtual ~ResponseGenerator() = default;

    virtual std::string generateResponse(const std::string& text) = 0;
};

inline constexpr const char* DEFAULT_RESPONDER_PROGRAM = "python3";
inline constexpr const char* DEFAULT_RESPONDER_SCRIPT  = "chatbot.py";
inline constexpr auto DEFAULT_RESPONDER_TIMEOUT = std::chrono::milliseconds(10000);

// Line-oriented bridge to a chatbot subprocess: it prints one greeting line
// at startup, then answers every line on stdin with exactly one line.
// Requests are served one at a time.
class ProcessResponder final : public ResponseGenerator {
public:
    ProcessResponder(QString program, QStringList arguments,
                     std::chrono::milliseconds timeout = DEFAULT_RESPONDER_TIMEOUT);
    ~ProcessResponder() override;

    ProcessResponder(const ProcessResponder&) = delete;
    ProcessResponder& operator=(const ProcessResponder&) = delete;

    // Starts the process and waits for its greeting. Returns false (and
    // logs) when the process cannot be started or stays silent.
    bool start();
    void shutdown();
    bool running() const;

    const std::string& greeting() const noexcept { return greeting_; }

    // Never throws for subprocess trouble: the reply then explains what
    // went wrong.
    std::string generateResponse(const std::string& text) override;

private:
    bool readLine(std::string& line);

    const QString program_;
    const QStringList arguments_;
    const std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::unique_ptr<QProcess> process_;
    std::string greeting_;
};

#endif // LANCHAT_RESPONDER_HPP
