#pragma once
#include <cstdint>
#include <map>

namespace qdist
{
    enum class ErrorKind
    {
        ConnectionFailed, // every attempt timed out or was rejected
        ConnectionError,  // the sampling task itself failed
        NoContactInfo,    // staked identity without a published contact info
        NoTPU,            // contact info without a TPU QUIC address
        NotAStakedNode    // requested identity/address has no stake
    };

    const char *to_string(ErrorKind kind);

    // Occurrence count and cumulative affected stake per error kind.
    class ErrorLedger
    {
    public:
        struct Entry
        {
            std::uint64_t count = 0;
            std::uint64_t stake = 0;
        };

        void record(ErrorKind kind, std::uint64_t stake);

        std::uint64_t count(ErrorKind kind) const;
        std::uint64_t stake(ErrorKind kind) const;
        bool empty() const { return entries_.empty(); }
        const std::map<ErrorKind, Entry> &entries() const { return entries_; }

    private:
        std::map<ErrorKind, Entry> entries_;
    };

    bool operator==(const ErrorLedger &a, const ErrorLedger &b);
} // namespace qdist
