/*
 * Sequence: SEQ0020
 * Track: C++
 * MVP: mvp2
 * Change: Implement edit-in-place delivery with backlog carry-over, file fallback and bounded retries.
 * Tests: test_delivery_cycle
 */
#include "tglogger/delivery_cycle.hpp"

#include <cctype>
#include <exception>
#include <sstream>
#include <utility>

namespace tglogger {

namespace {

constexpr const char *kCodeFence = "```";
constexpr const char *kFenceReplacement = "'''";
constexpr long kBadRequest = 400;

bool is_continuation(char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

// Largest cut <= limit that does not split a UTF-8 sequence. 0 when the first
// character alone is longer than limit.
std::size_t utf8_boundary(const std::string &text, std::size_t limit) {
    std::size_t cut = limit;
    while (cut > 0 && is_continuation(text[cut])) {
        --cut;
    }
    return cut;
}

std::string neutralize_fences(std::string text) {
    std::size_t pos = 0;
    while ((pos = text.find(kCodeFence, pos)) != std::string::npos) {
        text.replace(pos, 3, kFenceReplacement);
        pos += 3;
    }
    return text;
}

std::string describe_size(const std::string &text) {
    std::ostringstream oss;
    oss << text.size() << " bytes, " << LogBuffer::count_lines(text) << " lines";
    return oss.str();
}

} // namespace

std::string format_message(const std::string &title, const std::string &body) {
    // A fence inside the title or body would close the code block early and
    // make the API reject the Markdown.
    const std::string safe_title = neutralize_fences(title);
    const std::string safe_body = neutralize_fences(body);

    std::string text;
    text.reserve(safe_title.size() + safe_body.size() + kMessageFraming);
    text += kCodeFence;
    text += safe_title;
    text += '\n';
    text += safe_body;
    text += kCodeFence;
    return text;
}

std::string file_name_for(const std::string &title) {
    std::string name;
    name.reserve(title.size() + 4);
    for (char ch : title) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch) || ch == '_' || ch == '-' || ch == '.') {
            name.push_back(ch);
        } else {
            name.push_back('_');
        }
    }
    if (name.empty()) {
        name = "tglogger";
    }
    name += ".log";
    return name;
}

std::string file_caption_for(const std::string &title) {
    return title + ": too many logs for text messages, this file contains them.";
}

DeliveryCycle::DeliveryCycle(const HandlerConfig &config,
                             Transport &transport,
                             Sleeper sleeper,
                             std::shared_ptr<DiagnosticLogger> diagnostics)
    : config_(config),
      transport_(transport),
      sleeper_(std::move(sleeper)),
      diagnostics_(diagnostics ? std::move(diagnostics) : make_console_diagnostics()),
      state_{0, std::string()},
      backlog_(),
      stats_{0, 0, 0, 0, 0, 0, 0, 0} {}

DeliveryStats DeliveryCycle::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void DeliveryCycle::deliver(const DrainedLogs &batch) {
    if (!batch.text.empty()) {
        backlog_ += batch.text;
    }
    if (backlog_.empty()) {
        return;
    }

    if (backlog_.size() > config_.pending_logs) {
        deliver_file();
    } else {
        deliver_chunk(take_chunk());
    }
    update_backlog_stat();
}

void DeliveryCycle::deliver_file() {
    std::string content;
    content.swap(backlog_);

    const std::string filename = file_name_for(config_.title);
    const std::string caption = file_caption_for(config_.title);
    const CallResult result = run_with_retry("sendDocument", [&]() {
        transport_.send_file(filename, content, caption);
    }, false);

    if (result != CallResult::Delivered) {
        record_drop("sendDocument", content);
        return;
    }

    reset_state();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.files_sent;
    }
    diagnostics_->info("sent " + describe_size(content) + " as " + filename +
                       ", too much output for text messages");
}

void DeliveryCycle::deliver_chunk(const std::string &chunk) {
    if (state_.active()) {
        if (state_.text.size() + chunk.size() <= config_.message_limit) {
            const std::string combined = state_.text + chunk;
            const std::int64_t message_id = state_.message_id;
            const CallResult result = run_with_retry("editMessageText", [&]() {
                transport_.edit_message(message_id, format_message(config_.title, combined));
            }, true);

            if (result == CallResult::Delivered) {
                state_.text = combined;
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.messages_edited;
                return;
            }
            if (result == CallResult::Dropped) {
                record_drop("editMessageText", chunk);
                return;
            }
            diagnostics_->warn("message " + std::to_string(message_id) +
                               " can no longer be edited, starting a new one");
        }
        reset_state();
    }

    start_new_message(chunk);
}

void DeliveryCycle::start_new_message(const std::string &chunk) {
    std::int64_t message_id = 0;
    const CallResult result = run_with_retry("sendMessage", [&]() {
        message_id = transport_.send_message(format_message(config_.title, chunk));
    }, false);

    if (result != CallResult::Delivered) {
        record_drop("sendMessage", chunk);
        return;
    }

    state_.message_id = message_id;
    state_.text = chunk;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.messages_sent;
}

DeliveryCycle::CallResult DeliveryCycle::run_with_retry(const char *operation,
                                                        const std::function<void()> &call,
                                                        bool reject_bad_request) {
    RetryStateMachine machine(config_.retry);
    machine.begin();

    while (true) {
        std::chrono::milliseconds delay(0);
        try {
            call();
            machine.on_success();
            return CallResult::Delivered;
        } catch (const FloodWait &e) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.flood_waits;
            }
            delay = machine.on_flood_wait(e.retry_after());
            if (machine.phase() == DeliveryPhase::Dropped) {
                diagnostics_->error(std::string(operation) + " still rate limited after " +
                                    std::to_string(config_.retry.max_flood_waits) + " flood waits");
                return CallResult::Dropped;
            }
            diagnostics_->warn(std::string("got a FloodWait of ") + std::to_string(e.retry_after().count()) +
                               " seconds on " + operation + ", sleeping");
        } catch (const TransportError &e) {
            if (reject_bad_request && e.status() == kBadRequest) {
                machine.abandon();
                return CallResult::Rejected;
            }
            delay = machine.on_failure();
            if (machine.phase() == DeliveryPhase::Dropped) {
                diagnostics_->error(std::string(operation) + " failed " + std::to_string(machine.failures()) +
                                    " times, last error: " + e.what());
                return CallResult::Dropped;
            }
            diagnostics_->warn(std::string(operation) + " failed (" + e.what() + "), retrying in " +
                               std::to_string(delay.count()) + " ms");
        } catch (const std::exception &e) {
            delay = machine.on_failure();
            if (machine.phase() == DeliveryPhase::Dropped) {
                diagnostics_->error(std::string(operation) + " failed " + std::to_string(machine.failures()) +
                                    " times, last error: " + e.what());
                return CallResult::Dropped;
            }
            diagnostics_->warn(std::string(operation) + " failed (" + e.what() + "), retrying in " +
                               std::to_string(delay.count()) + " ms");
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.retries;
        }
        if (!sleeper_(delay)) {
            machine.abandon();
            diagnostics_->warn(std::string(operation) + " retry cancelled by shutdown");
            return CallResult::Dropped;
        }
        machine.resume();
    }
}

std::string DeliveryCycle::take_chunk() {
    const std::size_t limit = config_.message_limit;
    if (backlog_.size() <= limit) {
        std::string chunk;
        chunk.swap(backlog_);
        return chunk;
    }

    std::size_t cut = backlog_.rfind('\n', limit - 1);
    if (cut == std::string::npos) {
        // One line longer than a whole message.
        cut = utf8_boundary(backlog_, limit);
        if (cut == 0) {
            cut = 1;
            while (cut < backlog_.size() && is_continuation(backlog_[cut])) {
                ++cut;
            }
        }
    } else {
        ++cut;
    }

    std::string chunk = backlog_.substr(0, cut);
    backlog_.erase(0, cut);
    return chunk;
}

void DeliveryCycle::reset_state() {
    state_.message_id = 0;
    state_.text.clear();
}

void DeliveryCycle::record_drop(const char *operation, const std::string &text) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.dropped_batches;
        stats_.dropped_bytes += text.size();
    }
    diagnostics_->error(std::string("dropped ") + describe_size(text) + " after " + operation + " gave up");
}

void DeliveryCycle::update_backlog_stat() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.backlog_bytes = backlog_.size();
}

} // namespace tglogger
