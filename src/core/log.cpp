#include "log.hpp"

#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>

namespace kindle::log {

namespace {

// Fixed-capacity ring; slots are allocated once in init so a full log
// overwrites the oldest entry instead of shifting the rest.
struct Ring {
    std::vector<Entry> slots;
    size_t head{0};
    size_t size{0};

    void reset(size_t capacity) {
        slots.assign(capacity, Entry{});
        head = 0;
        size = 0;
    }

    void push(Level level, std::string_view category, std::string&& text) {
        if (slots.empty()) return;
        Entry& e = slots[(head + size) % slots.size()];
        e.level = level;
        e.category.assign(category.data(), category.size());
        e.text = static_cast<std::string&&>(text);
        if (size < slots.size()) ++size;
        else head = (head + 1) % slots.size();
    }

    template <class Fn>
    void each(Fn&& fn) const {
        for (size_t i = 0; i < size; ++i) fn(slots[(head + i) % slots.size()]);
    }
};

struct State {
    Config cfg{};
    std::FILE* file{};
    std::mutex m;
    Ring ring;
    bool ready{false};
};

State& s() {
    static State st;
    return st;
}

const char* level_str(Level l) {
    switch (l) {
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

unsigned char level_bit(Level l) {
    return static_cast<unsigned char>(1u << static_cast<unsigned>(l));
}

// HH:MM:SS.mmm
void format_timestamp(char (&buf)[16]) {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const std::time_t tt = clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
}

// Strips the directory so lines stay short for deep source trees.
const char* base_name(const char* path) {
    const char* out = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') out = p + 1;
    }
    return out;
}

// Caller holds st.m.
void write_line(State& st, const char* line, size_t n) {
    if (st.cfg.echo_stdout) {
        std::fwrite(line, 1, n, stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
    }
    if (!st.file) return;
    std::fwrite(line, 1, n, st.file);
    std::fputc('\n', st.file);
    std::fflush(st.file);
}

void ensure_ready(State& st) {
    if (st.ready) return;
    st.ring.reset(st.cfg.max_entries);
    st.ready = true;
}

}

void init(const Config& cfg) {
    auto& st = s();
    std::scoped_lock lk(st.m);
    st.cfg = cfg;
    st.ring.reset(cfg.max_entries);
    st.ready = true;
    if (st.file) {
        std::fclose(st.file);
        st.file = nullptr;
    }
    if (st.cfg.file_path.empty()) return;
    st.file = std::fopen(st.cfg.file_path.c_str(), "a");
    if (!st.file) {
        char msg[512];
        const int n = std::snprintf(msg, sizeof(msg), "WARN [Log] cannot open %s", st.cfg.file_path.c_str());
        if (n > 0) write_line(st, msg, static_cast<size_t>(n) < sizeof(msg) ? static_cast<size_t>(n) : sizeof(msg) - 1);
    }
}

void shutdown() {
    auto& st = s();
    std::scoped_lock lk(st.m);
    if (st.file) {
        std::fclose(st.file);
        st.file = nullptr;
    }
}

void set_level_mask(unsigned char mask) {
    auto& st = s();
    std::scoped_lock lk(st.m);
    st.cfg.level_mask = mask;
}

unsigned char level_mask() {
    auto& st = s();
    std::scoped_lock lk(st.m);
    return st.cfg.level_mask;
}

void log_line(Level level, std::string_view category, std::source_location loc, std::string msg) {
    auto& st = s();
    char ts[16];
    format_timestamp(ts);

    // Prefix is bounded; only the message body can be long.
    char prefix[256];
    int n = std::snprintf(prefix, sizeof(prefix), "%s [%s] [%.*s] %s:%u ",
                          ts, level_str(level), static_cast<int>(category.size()), category.data(),
                          base_name(loc.file_name()), static_cast<unsigned>(loc.line()));
    const size_t prefix_len = n < 0 ? 0 : (static_cast<size_t>(n) < sizeof(prefix) ? static_cast<size_t>(n) : sizeof(prefix) - 1);

    std::string line;
    line.reserve(prefix_len + msg.size());
    line.append(prefix, prefix_len);
    line += msg;

    std::scoped_lock lk(st.m);
    if ((st.cfg.level_mask & level_bit(level)) == 0) return;
    ensure_ready(st);
    write_line(st, line.data(), line.size());
    st.ring.push(level, category, static_cast<std::string&&>(msg));
}

std::vector<Entry> snapshot() {
    auto& st = s();
    std::scoped_lock lk(st.m);
    std::vector<Entry> out;
    out.reserve(st.ring.size);
    st.ring.each([&](const Entry& e) { out.push_back(e); });
    return out;
}

size_t count(std::string_view category) {
    auto& st = s();
    std::scoped_lock lk(st.m);
    size_t n = 0;
    st.ring.each([&](const Entry& e) { n += e.category == category ? 1 : 0; });
    return n;
}

void clear() {
    auto& st = s();
    std::scoped_lock lk(st.m);
    st.ring.head = 0;
    st.ring.size = 0;
}

}
