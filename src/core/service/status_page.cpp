#include <canary/core/service/status_page.hpp>
#include <canary/core/utils/relative_time.hpp>
#include <canary/core/utils/text.hpp>

namespace Canary {

namespace {

constexpr const char* kPageHead = R"(<!DOCTYPE html>
<meta charset="utf-8">
<title>presence canary</title>
<style>
    body {
        max-width: 960px;
        font-family: sans-serif;
        font-size: 1.25em;
        margin: 0 auto;
    }
</style>

<h1>presence canary</h1>
)";

} // anonymous namespace

std::string renderStatusPage(const std::vector<PingEvent>& pings,
                             size_t capacity,
                             std::chrono::system_clock::time_point now) {
    std::string page = kPageHead;
    page += "<p>known pings (up to " + std::to_string(capacity) + "):</p>\n";
    page += "<ol>\n";

    for (const auto& ping : pings) {
        page += "    <li>";
        page += escapeHtml(ping.reason);
        page += " - <time datetime=\"";
        page += formatUtcTimestamp(ping.timestamp);
        page += "\">";
        page += humanizeSince(ping.timestamp, now);
        page += "</time></li>\n";
    }

    page += "</ol>\n";
    return page;
}

} // namespace Canary
