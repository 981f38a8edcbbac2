#pragma once

#include <string>
#include <utility>

namespace storyline {

// ─── Per-Unit Outcome ───────────────────────────────────────────────────────

// Failures that abort one segment or story but not the process.
enum class Status {
    Ok,
    OffsetMismatch,   // word or entity offsets disagree with the text
    TranscriptDesync, // NER token not found at or after the scan offset
    BracketMismatch,  // input ended inside a bracketed span
};

template <typename T> struct Result {
    T value{};
    Status status = Status::Ok;
    std::string message;

    bool ok() const { return status == Status::Ok; }
    explicit operator bool() const { return ok(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Status s, std::string msg) {
        Result r;
        r.status = s;
        r.message = std::move(msg);
        return r;
    }

    // Carry another result's failure into this result type.
    template <typename U> static Result failure_from(const Result<U> &other) {
        return failure(other.status, other.message);
    }
};

inline const char *status_name(Status status) {
    switch (status) {
    case Status::Ok:
        return "ok";
    case Status::OffsetMismatch:
        return "offset mismatch";
    case Status::TranscriptDesync:
        return "transcript desync";
    case Status::BracketMismatch:
        return "bracket mismatch";
    }
    return "unknown";
}

} // namespace storyline
