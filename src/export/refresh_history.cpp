#include <pbi_scan/export/refresh_history.hpp>

#include <pbi_scan/core/log.hpp>
#include <pbi_scan/core/url.hpp>
#include <pbi_scan/scan/scan_document.hpp>

#include <cctype>
#include <cmath>

namespace pbi_scan {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
long long DaysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

bool ReadDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool Expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

RefreshEntry ParseEntry(const nlohmann::json& node) {
    RefreshEntry entry;
    entry.request_id = StringOr(node, "requestId");
    entry.refresh_type = StringOr(node, "refreshType");
    entry.status = StringOr(node, "status");
    entry.start_time = StringOr(node, "startTime");
    entry.end_time = StringOr(node, "endTime");
    entry.duration_minutes = DurationMinutes(entry.start_time, entry.end_time);
    entry.service_exception = StringOr(node, "serviceExceptionJson");
    return entry;
}

} // anonymous namespace

const char* RefreshHistoryOutcomeName(RefreshHistoryOutcome outcome) {
    switch (outcome) {
        case RefreshHistoryOutcome::HasRefreshHistory: return "HasRefreshHistory";
        case RefreshHistoryOutcome::NoHistory:         return "NoHistory";
        case RefreshHistoryOutcome::NotSupported:      return "NotSupported";
        case RefreshHistoryOutcome::Error:             return "Error";
    }
    return "Error";
}

std::optional<double> ParseIsoTimestamp(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }

    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        double scale = 0.1;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            fraction += (text[pos] - '0') * scale;
            scale /= 10.0;
            ++pos;
            ++digits;
        }
        if (digits == 0) return std::nullopt;
    }

    int offset_seconds = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!ReadDigits(text, pos, 2, oh)) return std::nullopt;
            Expect(text, pos, ':');
            if (!ReadDigits(text, pos, 2, om)) return std::nullopt;
            offset_seconds = sign * (oh * 3600 + om * 60);
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const auto days = DaysFromCivil(year, static_cast<unsigned>(month),
                                    static_cast<unsigned>(day));
    const double seconds = static_cast<double>(days) * 86400.0 + hour * 3600.0 +
                           minute * 60.0 + second + fraction - offset_seconds;
    return seconds;
}

std::optional<double> DurationMinutes(const std::string& start, const std::string& end) {
    auto s = ParseIsoTimestamp(start);
    auto e = ParseIsoTimestamp(end);
    if (!s || !e) {
        return std::nullopt;
    }
    return std::round((*e - *s) / 60.0 * 100.0) / 100.0;
}

RefreshHistory RefreshHistoryClient::GetRefreshHistory(const std::string& workspace_id,
                                                       const std::string& dataset_id,
                                                       int top) {
    const auto path = WithQuery("/v1.0/myorg/groups/" + UrlEncode(workspace_id) +
                                    "/datasets/" + UrlEncode(dataset_id) + "/refreshes",
                                {{"$top", std::to_string(top)}});

    RefreshHistory history;
    auto response = gateway_.GetJson(path);
    if (response.IsErr()) {
        if (response.Error().IsNotFound()) {
            history.outcome = RefreshHistoryOutcome::NotSupported;
        } else {
            history.outcome = RefreshHistoryOutcome::Error;
            history.error_message = response.Error().ToString();
            LogWarn("refresh", "Refresh history for dataset " + dataset_id +
                                   " failed: " + history.error_message);
        }
        return history;
    }

    for (const auto& node : Children(response.Value(), "value")) {
        history.entries.push_back(ParseEntry(node));
    }
    history.outcome = history.entries.empty() ? RefreshHistoryOutcome::NoHistory
                                              : RefreshHistoryOutcome::HasRefreshHistory;
    return history;
}

} // namespace pbi_scan
