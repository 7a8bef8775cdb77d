#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <ranges>
#include <string>
#include <vector>

struct SyncMetrics
{
    std::atomic<uint64_t> envelopes_received{0};
    std::atomic<uint64_t> envelopes_rejected{0};
    std::atomic<uint64_t> requests_received{0};
    std::atomic<uint64_t> responses_received{0};
    std::atomic<uint64_t> entries_recovered{0};
    std::atomic<uint64_t> entries_skipped{0};
    std::atomic<uint64_t> messages_sent{0};
    std::atomic<uint64_t> messages_truncated{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    SyncMetrics() = default;

    void reset()
    {
        start_time = std::chrono::steady_clock::now();
        envelopes_received = 0;
        envelopes_rejected = 0;
        requests_received = 0;
        responses_received = 0;
        entries_recovered = 0;
        entries_skipped = 0;
        messages_sent = 0;
        messages_truncated = 0;
    }
};

template<>
struct std::formatter<SyncMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const SyncMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t recovered = s.entries_recovered.load();
        uint64_t skipped = s.entries_skipped.load();

        std::vector<std::string> lines;

        lines.push_back(std::format("--- CACHE SYNC ({}s) ---", uptime));
        lines.push_back(std::format("  Envelopes:       {} received, {} rejected",
                                    s.envelopes_received.load(), s.envelopes_rejected.load()));
        lines.push_back(std::format("  Requests:        {}", s.requests_received.load()));
        lines.push_back(std::format("  Responses:       {}", s.responses_received.load()));
        lines.push_back(std::format("  Entries:         {} recovered, {} skipped ({:.1f}% loss)",
                                    recovered, skipped,
                                    recovered + skipped > 0 ? skipped * 100.0 / (recovered + skipped) : 0.0));
        lines.push_back(std::format("  Messages sent:   {} ({} left out by size)",
                                    s.messages_sent.load(), s.messages_truncated.load()));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
