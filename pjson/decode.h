#pragma once

#include "content.h"
#include "error.h"
#include "generable.h"
#include "json-partial.h"
#include "log.h"
#include "schema.h"
#include "text-buffer.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct pjson_decode_params {
    pjson_completion_params completion;           // conservative completion by default
    size_t                  max_buffer_bytes = 1000000;
    bool                    skip_unchanged   = false; // drop snapshots whose content equals the previous one
};

//
// Upstream
//

// A finite sequence of text deltas, e.g. a model's streamed output. Delta boundaries carry
// no meaning and may fall inside a token, a string or a multi-byte character.
class pjson_text_source {
  public:
    virtual ~pjson_text_source() = default;

    // Fetches the next delta. Returns false at the end of the sequence, throws on upstream failure.
    virtual bool next(std::string & delta) = 0;

    // Asks the producer to stop. next() is not called again afterwards.
    virtual void cancel() {}
};

class pjson_text_source_from_deltas : public pjson_text_source {
    std::vector<std::string> deltas_;
    size_t pos_ = 0;
    bool cancelled_ = false;

  public:
    explicit pjson_text_source_from_deltas(std::vector<std::string> deltas) : deltas_(std::move(deltas)) {}

    bool next(std::string & delta) override;
    void cancel() override { cancelled_ = true; }

    bool cancelled() const { return cancelled_; }
    size_t consumed() const { return pos_; }
};

class pjson_text_source_from_function : public pjson_text_source {
    std::function<bool(std::string &)> next_;
    std::function<void()> cancel_;

  public:
    explicit pjson_text_source_from_function(std::function<bool(std::string &)> next, std::function<void()> cancel = nullptr)
        : next_(std::move(next)), cancel_(std::move(cancel)) {}

    bool next(std::string & delta) override { return next_(delta); }
    void cancel() override {
        if (cancel_) {
            cancel_();
        }
    }
};

//
// Untyped decoder
//

struct pjson_decode_update {
    pjson_content content;
    bool is_complete = false; // the accumulated text was valid JSON without completion
};

// Accumulates deltas and re-runs completion and parsing over the whole text on every push.
// Single producer, not thread-safe. Errors leave the decoder finished.
class pjson_decoder {
    pjson_decode_params params_;
    pjson_text_buffer buffer_;
    std::optional<pjson_content> last_;
    bool last_complete_ = false;
    bool finished_ = false;

    std::optional<pjson_decode_update> decode(bool final);

  public:
    explicit pjson_decoder(const pjson_decode_params & params = {});

    // Appends a delta. Returns the new snapshot, or std::nullopt when nothing could be decoded
    // yet (or, with skip_unchanged, when the content did not change).
    // Throws pjson_buffer_limit_error or pjson_parse_error.
    std::optional<pjson_decode_update> push(const std::string & delta);

    // Final pass once upstream completed. Returns a snapshot only when its content differs
    // from the last one returned. Throws pjson_depth_exceeded_error or pjson_parse_error when
    // the text cannot be decoded and no snapshot was ever produced.
    std::optional<pjson_decode_update> finish();

    const std::optional<pjson_content> & last() const { return last_; }
    const std::string & text() const { return buffer_.text(); }
    bool finished() const { return finished_; }
};

//
// Typed stream
//

enum pjson_termination {
    PJSON_TERMINATION_FINISHED,
    PJSON_TERMINATION_CANCELLED,
    PJSON_TERMINATION_FAILED,
};

const char * pjson_termination_name(pjson_termination reason);

// Progressive decoding of a text source into partial projections of T. Iterate with next();
// cancel() or destroying the stream before the end cancels the source.
template <typename T>
class pjson_structured_stream {
  public:
    using partial_type = typename pjson_generable<T>::partial_type;

    struct snapshot {
        partial_type  content;
        pjson_content raw;
        bool          is_complete = false;
    };

  private:
    std::unique_ptr<pjson_text_source> source_;
    pjson_schema schema_;
    pjson_decoder decoder_;
    std::function<void(pjson_termination)> on_termination_;
    size_t n_snapshots_ = 0;
    bool finished_ = false;
    pjson_termination termination_ = PJSON_TERMINATION_FINISHED;

    void terminate(pjson_termination reason) {
        if (finished_) {
            return;
        }
        finished_ = true;
        termination_ = reason;
        LOG_DBG("%s: %s after %zu snapshots\n", __func__, pjson_termination_name(reason), n_snapshots_);
        if (on_termination_) {
            on_termination_(reason);
        }
    }

    void fail(bool cancel_source) {
        if (cancel_source && !finished_) {
            source_->cancel();
        }
        terminate(PJSON_TERMINATION_FAILED);
    }

    void make_snapshot(const pjson_decode_update & update, snapshot & out) {
        out.content     = pjson_generable<T>::partial_from_content(pjson_schema_project(schema_, update.content));
        out.raw         = update.content;
        out.is_complete = update.is_complete;
        n_snapshots_++;
    }

  public:
    explicit pjson_structured_stream(std::unique_ptr<pjson_text_source> source, const pjson_decode_params & params = {})
        : source_(std::move(source)),
          schema_(pjson_generable<T>::schema()),
          decoder_(params) {}

    pjson_structured_stream(const pjson_structured_stream &) = delete;
    pjson_structured_stream & operator=(const pjson_structured_stream &) = delete;

    ~pjson_structured_stream() {
        if (!finished_) {
            cancel();
        }
    }

    // Called exactly once, when the stream finishes, is cancelled or fails.
    void on_termination(std::function<void(pjson_termination)> callback) {
        on_termination_ = std::move(callback);
    }

    // Fills `out` with the next snapshot. Returns false once the stream has ended.
    bool next(snapshot & out) {
        while (!finished_) {
            std::string delta;
            bool has_delta;
            try {
                has_delta = source_->next(delta);
            } catch (const std::exception & e) {
                LOG_WRN("%s: upstream failed: %s\n", __func__, e.what());
                fail(false);
                if (n_snapshots_ == 0) {
                    throw pjson_no_content_error();
                }
                throw;
            }

            std::optional<pjson_decode_update> update;
            try {
                update = has_delta ? decoder_.push(delta) : decoder_.finish();
                if (update) {
                    make_snapshot(*update, out);
                }
            } catch (const std::exception &) {
                // decoder errors and conversion failures in partial_from_content()
                fail(has_delta);
                throw;
            }

            if (!has_delta) {
                terminate(PJSON_TERMINATION_FINISHED);
            }
            if (update) {
                return true;
            }
        }
        return false;
    }

    void cancel() {
        if (finished_) {
            return;
        }
        source_->cancel();
        terminate(PJSON_TERMINATION_CANCELLED);
    }

    // Consumes the whole stream and converts the final content to T.
    // Throws pjson_no_content_error when no snapshot was produced, pjson_error when the
    // stream was cancelled before the end.
    T collect() {
        return reduce(nullptr);
    }

    std::optional<T> collect_or_null() {
        try {
            return collect();
        } catch (const pjson_no_content_error &) {
            return std::nullopt;
        }
    }

    // Like collect(), passing every partial projection to `handler` on the way.
    T reduce(const std::function<void(const partial_type &)> & handler) {
        snapshot snap;
        while (next(snap)) {
            if (handler) {
                handler(snap.content);
            }
        }
        if (termination_ != PJSON_TERMINATION_FINISHED || !decoder_.finished()) {
            throw pjson_error(std::string("Stream ended before its final pass: ") + pjson_termination_name(termination_));
        }
        if (!decoder_.last()) {
            throw pjson_no_content_error();
        }
        return pjson_generable<T>::from_content(*decoder_.last());
    }

    bool finished() const { return finished_; }
    // Meaningful once finished() is true.
    pjson_termination termination() const { return termination_; }
    size_t snapshot_count() const { return n_snapshots_; }
};

// Single-shot decoding of a complete (or truncated) response, with the same completion
// semantics as the stream.
template <typename T>
T pjson_decode(const std::string & text, const pjson_completion_params & params = {}) {
    return pjson_generable<T>::from_content(pjson_complete_then_parse(text, params));
}
