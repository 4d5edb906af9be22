#include "status_reporter.hpp"

StatusReporter::StatusReporter(std::string owner, Listener listener)
    : owner_(std::move(owner)), listener_(std::move(listener)) {}

void StatusReporter::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void StatusReporter::emit(Status status) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = status;
        listener = listener_;
    }
    // Called outside the lock so a listener may read current()
    if (listener) listener(owner_, status);
}

void StatusReporter::begin() {
    bool had_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        had_error = current_.color == StatusColor::Red;
    }
    if (had_error) clear();
}

void StatusReporter::connecting() {
    emit({StatusColor::Blue, StatusShape::Dot, "connecting"});
}

void StatusReporter::progress(const std::string& text) {
    emit({StatusColor::Yellow, StatusShape::Dot, text});
}

void StatusReporter::succeeded() {
    emit({StatusColor::Green, StatusShape::Dot, "done"});
    clear();
}

void StatusReporter::failed() {
    emit({StatusColor::Red, StatusShape::Ring, "error"});
}

void StatusReporter::clear() {
    emit(Status{});
}

Status StatusReporter::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::string StatusReporter::progress_text(const std::string& operation) {
    if (operation == "list")   return "listing";
    if (operation == "get")    return "downloading";
    if (operation == "put")    return "uploading";
    if (operation == "delete") return "deleting";
    if (operation == "mkdir")  return "creating";
    if (operation == "rmdir")  return "removing";
    if (operation == "open")   return "opening";
    if (operation == "close")  return "closing";
    return operation;
}
