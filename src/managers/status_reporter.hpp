#pragma once

#include <functional>
#include <mutex>
#include <string>

enum class StatusColor { None, Blue, Yellow, Green, Red };
enum class StatusShape { None, Dot, Ring };

// One status marker. An empty text with StatusColor::None means cleared.
struct Status {
    StatusColor color = StatusColor::None;
    StatusShape shape = StatusShape::None;
    std::string text;

    bool cleared() const { return color == StatusColor::None && text.empty(); }
};

// StatusReporter: status side channel of one operation node.
//
//   connecting   blue dot     (only when a new session is being established)
//   <progress>   yellow dot   "listing", "uploading", ...
//   done         green dot, then cleared right away
//   error        red ring, kept until the next operation starts
class StatusReporter {
public:
    using Listener = std::function<void(const std::string& owner, const Status&)>;

    explicit StatusReporter(std::string owner, Listener listener = nullptr);

    void set_listener(Listener listener);

    void begin();                               // new operation: drop a retained error
    void connecting();
    void progress(const std::string& text);
    void succeeded();
    void failed();
    void clear();

    Status current() const;

    // In-progress text for an operation name ("put" -> "uploading").
    static std::string progress_text(const std::string& operation);

private:
    std::string owner_;
    mutable std::mutex mutex_;
    Listener listener_;
    Status current_;

    void emit(Status status);
};
