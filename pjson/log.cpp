#include "log.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <vector>

int pjson_log_verbosity_thold = 0;

void pjson_log_set_verbosity_thold(int verbosity) {
    pjson_log_verbosity_thold = verbosity;
}

static int64_t t_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// colors
enum pjson_log_col : int {
    PJSON_LOG_COL_DEFAULT = 0,
    PJSON_LOG_COL_BOLD,
    PJSON_LOG_COL_RED,
    PJSON_LOG_COL_GREEN,
    PJSON_LOG_COL_YELLOW,
    PJSON_LOG_COL_BLUE,
    PJSON_LOG_COL_MAGENTA,
    PJSON_LOG_COL_CYAN,
    PJSON_LOG_COL_WHITE,
};

// disable colors by default
static std::vector<const char *> g_col = {
    "",
    "",
    "",
    "",
    "",
    "",
    "",
    "",
    "",
};

struct pjson_log {
    std::mutex mtx;

    bool prefix     = false;
    bool timestamps = false;

    FILE * file = nullptr;

    int64_t t_start = t_us();

    std::vector<char> msg = std::vector<char>(256);

    ~pjson_log() {
        if (file) {
            fclose(file);
        }
    }

    void write(pjson_log_level level, int64_t timestamp, FILE * fcur) const {
        if (level == PJSON_LOG_LEVEL_NONE && fcur == stdout) {
            fprintf(fcur, "%s", msg.data());
            return;
        }

        if (prefix) {
            if (timestamps) {
                // [M.s.ms.us]
                fprintf(fcur, "%s%d.%02d.%03d.%03d%s ",
                        g_col[PJSON_LOG_COL_BLUE],
                        (int) (timestamp / 1000000 / 60),
                        (int) (timestamp / 1000000 % 60),
                        (int) (timestamp / 1000 % 1000),
                        (int) (timestamp % 1000),
                        g_col[PJSON_LOG_COL_DEFAULT]);
            }

            switch (level) {
                case PJSON_LOG_LEVEL_INFO:  fprintf(fcur, "%sI %s", g_col[PJSON_LOG_COL_GREEN],   g_col[PJSON_LOG_COL_DEFAULT]); break;
                case PJSON_LOG_LEVEL_WARN:  fprintf(fcur, "%sW ",   g_col[PJSON_LOG_COL_MAGENTA]                              ); break;
                case PJSON_LOG_LEVEL_ERROR: fprintf(fcur, "%sE ",   g_col[PJSON_LOG_COL_RED]                                  ); break;
                case PJSON_LOG_LEVEL_DEBUG: fprintf(fcur, "%sD ",   g_col[PJSON_LOG_COL_YELLOW]                               ); break;
                default:
                    break;
            }
        }

        fprintf(fcur, "%s", msg.data());

        if (level == PJSON_LOG_LEVEL_WARN || level == PJSON_LOG_LEVEL_ERROR || level == PJSON_LOG_LEVEL_DEBUG) {
            fprintf(fcur, "%s", g_col[PJSON_LOG_COL_DEFAULT]);
        }

        fflush(fcur);
    }

    void add(pjson_log_level level, const char * fmt, va_list args) {
        std::lock_guard<std::mutex> lock(mtx);

        va_list args_copy;
        va_copy(args_copy, args);

        const size_t n = vsnprintf(msg.data(), msg.size(), fmt, args);
        if (n >= msg.size()) {
            msg.resize(n + 1);
            vsnprintf(msg.data(), msg.size(), fmt, args_copy);
        }
        va_end(args_copy);

        const int64_t timestamp = t_us() - t_start;

        FILE * fcur = level == PJSON_LOG_LEVEL_NONE || level == PJSON_LOG_LEVEL_INFO ? stdout : stderr;
        write(level, timestamp, fcur);

        if (file) {
            write(level, timestamp, file);
        }
    }

    void set_file(const char * path) {
        std::lock_guard<std::mutex> lock(mtx);

        if (file) {
            fclose(file);
            file = nullptr;
        }

        if (path) {
            file = fopen(path, "w");
            if (!file) {
                fprintf(stderr, "%s: failed to open log file '%s'\n", __func__, path);
            }
        }
    }

    void set_colors(bool colors) {
        std::lock_guard<std::mutex> lock(mtx);

        if (colors) {
            g_col[PJSON_LOG_COL_DEFAULT] = LOG_COL_DEFAULT;
            g_col[PJSON_LOG_COL_BOLD]    = LOG_COL_BOLD;
            g_col[PJSON_LOG_COL_RED]     = LOG_COL_RED;
            g_col[PJSON_LOG_COL_GREEN]   = LOG_COL_GREEN;
            g_col[PJSON_LOG_COL_YELLOW]  = LOG_COL_YELLOW;
            g_col[PJSON_LOG_COL_BLUE]    = LOG_COL_BLUE;
            g_col[PJSON_LOG_COL_MAGENTA] = LOG_COL_MAGENTA;
            g_col[PJSON_LOG_COL_CYAN]    = LOG_COL_CYAN;
            g_col[PJSON_LOG_COL_WHITE]   = LOG_COL_WHITE;
        } else {
            for (size_t i = 0; i < g_col.size(); i++) {
                g_col[i] = "";
            }
        }
    }

    void set_prefix(bool prefix) {
        std::lock_guard<std::mutex> lock(mtx);
        this->prefix = prefix;
    }

    void set_timestamps(bool timestamps) {
        std::lock_guard<std::mutex> lock(mtx);
        this->timestamps = timestamps;
    }
};

//
// public API
//

struct pjson_log * pjson_log_main() {
    static struct pjson_log log;
    return &log;
}

void pjson_log_add(struct pjson_log * log, enum pjson_log_level level, const char * fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log->add(level, fmt, args);
    va_end(args);
}

void pjson_log_set_file(struct pjson_log * log, const char * file) {
    log->set_file(file);
}

void pjson_log_set_colors(struct pjson_log * log, bool colors) {
    log->set_colors(colors);
}

void pjson_log_set_prefix(struct pjson_log * log, bool prefix) {
    log->set_prefix(prefix);
}

void pjson_log_set_timestamps(struct pjson_log * log, bool timestamps) {
    log->set_timestamps(timestamps);
}
