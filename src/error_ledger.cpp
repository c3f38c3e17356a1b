#include "error_ledger.hpp"

namespace qdist {

const char *to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConnectionFailed: return "Connection failed";
    case ErrorKind::ConnectionError:  return "Connection error";
    case ErrorKind::NoContactInfo:    return "No contact info";
    case ErrorKind::NoTPU:            return "No TPU";
    case ErrorKind::NotAStakedNode:   return "Not a staked node";
    }
    return "Unknown error";
}

void ErrorLedger::record(ErrorKind kind, std::uint64_t stake) {
    Entry &e = entries_[kind];
    e.count += 1;
    e.stake += stake;
}

std::uint64_t ErrorLedger::count(ErrorKind kind) const {
    auto it = entries_.find(kind);
    return it == entries_.end() ? 0 : it->second.count;
}

std::uint64_t ErrorLedger::stake(ErrorKind kind) const {
    auto it = entries_.find(kind);
    return it == entries_.end() ? 0 : it->second.stake;
}

bool operator==(const ErrorLedger &a, const ErrorLedger &b) {
    if (a.entries().size() != b.entries().size()) return false;
    for (const auto &[kind, e] : a.entries()) {
        auto it = b.entries().find(kind);
        if (it == b.entries().end() || it->second.count != e.count || it->second.stake != e.stake)
            return false;
    }
    return true;
}

} // namespace qdist
