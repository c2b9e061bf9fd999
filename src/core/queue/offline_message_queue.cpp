#include "core/queue/offline_message_queue.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <utility>

namespace dispatch {
namespace core {

OfflineMessageQueue::OfflineMessageQueue(dispatch::common::Scheduler& scheduler,
                                         std::shared_ptr<QueueStore> primary,
                                         dispatch::common::QueueConfig config)
    : scheduler_(scheduler), primary_(std::move(primary)), config_(std::move(config)) {}

OfflineMessageQueue::~OfflineMessageQueue() {
    Stop();
}

void OfflineMessageQueue::Start() {
    if (sweep_timer_) {
        return;
    }
    ScheduleSweep();
}

void OfflineMessageQueue::Stop() {
    if (sweep_timer_) {
        scheduler_.Cancel(*sweep_timer_);
        sweep_timer_.reset();
    }
}

void OfflineMessageQueue::ScheduleSweep() {
    sweep_timer_ = scheduler_.ScheduleAfter(std::chrono::milliseconds(config_.sweep_interval_ms), [this]() {
        Sweep();
        ScheduleSweep();
    });
}

void OfflineMessageQueue::Enqueue(const std::string& user_id, const proto::dispatch::ServerEvent& event) {
    const auto now_ms = dispatch::common::UnixMillis();
    proto::dispatch::QueuedMessage message;
    *message.mutable_event() = event;
    message.set_enqueued_at_ms(now_ms);
    message.set_expires_at_ms(now_ms + static_cast<std::int64_t>(config_.message_ttl_seconds) * 1000);
    message.set_sequence(next_sequence_++);

    if (primary_) {
        auto status = primary_->Append(user_id, message);
        if (status.IsOk()) {
            return;
        }
        DISPATCH_LOG_WARN("[OfflineQueue] DegradedCache: enqueue for {} falls back to memory: {}",
                          user_id, status.Message());
    }
    auto status = fallback_.Append(user_id, message);
    if (!status.IsOk()) {
        DISPATCH_LOG_WARN("[OfflineQueue] Dropped message for {}: {}", user_id, status.Message());
    }
}

std::vector<proto::dispatch::ServerEvent> OfflineMessageQueue::DrainAndClear(const std::string& user_id) {
    std::vector<proto::dispatch::QueuedMessage> messages;
    auto local = fallback_.TakeAll(user_id);
    if (local.IsOk()) {
        messages = std::move(local).Value();
    }
    if (primary_) {
        auto stored = primary_->TakeAll(user_id);
        if (stored.IsOk()) {
            auto& items = stored.Value();
            messages.insert(messages.end(),
                            std::make_move_iterator(items.begin()),
                            std::make_move_iterator(items.end()));
        } else {
            DISPATCH_LOG_WARN("[OfflineQueue] DegradedCache: drain for {} skipped shared store: {}",
                              user_id, stored.GetStatus().Message());
        }
    }

    std::stable_sort(messages.begin(), messages.end(),
                     [](const proto::dispatch::QueuedMessage& a, const proto::dispatch::QueuedMessage& b) {
                         if (a.enqueued_at_ms() != b.enqueued_at_ms()) {
                             return a.enqueued_at_ms() < b.enqueued_at_ms();
                         }
                         return a.sequence() < b.sequence();
                     });

    const auto now_ms = dispatch::common::UnixMillis();
    std::vector<proto::dispatch::ServerEvent> events;
    events.reserve(messages.size());
    std::size_t expired = 0;
    for (auto& message : messages) {
        if (message.expires_at_ms() <= now_ms) {
            ++expired;
            continue;
        }
        events.push_back(std::move(*message.mutable_event()));
    }
    if (!events.empty() || expired > 0) {
        DISPATCH_LOG_INFO("[OfflineQueue] Drained {} message(s) for {} (expired={})", events.size(), user_id, expired);
    }
    return events;
}

std::size_t OfflineMessageQueue::Sweep() {
    const auto now_ms = dispatch::common::UnixMillis();
    std::size_t purged = 0;
    auto local = fallback_.PurgeExpired(now_ms);
    if (local.IsOk()) {
        purged += local.Value();
    }
    if (primary_) {
        auto stored = primary_->PurgeExpired(now_ms);
        if (stored.IsOk()) {
            purged += stored.Value();
        } else {
            DISPATCH_LOG_WARN("[OfflineQueue] DegradedCache: sweep failed: {}", stored.GetStatus().Message());
        }
    }
    if (purged > 0) {
        DISPATCH_LOG_INFO("[OfflineQueue] Purged {} expired message(s)", purged);
    }
    return purged;
}

}
}
