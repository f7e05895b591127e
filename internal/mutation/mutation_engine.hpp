#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "internal/api/api_result.hpp"
#include "internal/notify/messenger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/published_value.hpp"

namespace hacktracker::mutation {

constexpr char kDefaultErrorMessage[] = "Operation failed";

/*
  One optimistic mutation over a collection of type T.

  Each transform receives the collection value as it is at the moment the
  step runs, never a snapshot from an earlier step.
*/
template <typename T, typename R>
struct MutationDescriptor {
  std::function<T(const T& current)>                       optimistic_update;
  std::function<void(api::ApiCallback<R> done)>           api_call;
  std::function<T(const T& current, const R& result)>      apply_result;
  std::function<T(const T& current)>                       rollback;

  // shown on success when non-empty
  std::string success_message;
  // builds the error toast; kDefaultErrorMessage when unset
  std::function<std::string(const std::exception& error)> error_message;
};

enum class MutationStatus {
  kApplied,
  kRolledBack,
  kSkipped, // collection had no data yet
};

template <typename R>
struct MutationOutcome {
  MutationStatus   status = MutationStatus::kSkipped;
  std::optional<R> value;
  std::string      error_message;

  bool ok() const {
    return status == MutationStatus::kApplied;
  }
};

/*
  Optimistic-update executor for one published collection.

    1. publish optimistic_update(current)
    2. api_call()
    3. success: publish apply_result(current, result)
       failure: publish rollback(current), show the error

  No locking and no retries. Several mutations may be in flight on the
  same collection; correctness comes from every step reading the live
  value. Completions capture the collection cell by shared_ptr, so a
  mutation still lands after its caller is gone.
*/
template <typename T>
class MutationEngine {
 public:
  MutationEngine(std::shared_ptr<state::PublishedValue<T>> value, std::shared_ptr<notify::Messenger> messenger, std::string name)
      : value_(std::move(value)), messenger_(std::move(messenger)), name_(std::move(name)) {
  }

  template <typename R>
  void Mutate(MutationDescriptor<T, R> descriptor, std::function<void(MutationOutcome<R>)> done = {}) {
    if (!value_->HasData()) {
      HACKTRACKER_LOG_DEBUG("mutation skipped, collection not loaded", {observability::StringField("collection", name_)});
      if (done) done(MutationOutcome<R>{});
      return;
    }

    auto d = std::make_shared<MutationDescriptor<T, R>>(std::move(descriptor));

    value_->SetData(d->optimistic_update(value_->Data()));

    auto settled = std::make_shared<bool>(false);
    api::ApiCallback<R> complete = [d, settled, done, value = value_, messenger = messenger_, name = name_](api::ApiResult<R> result) {
      if (*settled) {
        HACKTRACKER_LOG_WARN("duplicate api completion ignored", {observability::StringField("collection", name)});
        return;
      }
      *settled = true;

      if (result.ok()) {
        if (value->HasData()) {
          value->SetData(d->apply_result(value->Data(), result.value()));
        } else {
          HACKTRACKER_LOG_WARN("collection cleared before mutation completed", {observability::StringField("collection", name)});
        }

        if (!d->success_message.empty()) {
          messenger->ShowSuccess(d->success_message);
        }

        MutationOutcome<R> outcome;
        outcome.status = MutationStatus::kApplied;
        outcome.value  = result.value();
        if (done) done(std::move(outcome));
        return;
      }

      const auto message = DescribeFailure(*d, result.error());

      if (value->HasData()) {
        value->SetData(d->rollback(value->Data()));
      } else {
        HACKTRACKER_LOG_WARN("collection cleared before rollback", {observability::StringField("collection", name)});
      }

      messenger->ShowError(message);
      HACKTRACKER_LOG_WARN("mutation rolled back",
                           {observability::StringField("collection", name), observability::StringField("error", message)});

      MutationOutcome<R> outcome;
      outcome.status        = MutationStatus::kRolledBack;
      outcome.error_message = message;
      if (done) done(std::move(outcome));
    };

    try {
      d->api_call(complete);
    } catch (...) {
      complete(api::ApiResult<R>::Fail(std::current_exception()));
    }
  }

  const std::shared_ptr<state::PublishedValue<T>>& value() const {
    return value_;
  }

 private:
  template <typename R>
  static std::string DescribeFailure(const MutationDescriptor<T, R>& d, const std::exception_ptr& error) {
    if (!error) return kDefaultErrorMessage;

    try {
      std::rethrow_exception(error);
    } catch (const std::exception& e) {
      return d.error_message ? d.error_message(e) : std::string(kDefaultErrorMessage);
    } catch (...) {
      return kDefaultErrorMessage;
    }
  }

  std::shared_ptr<state::PublishedValue<T>> value_;
  std::shared_ptr<notify::Messenger>        messenger_;
  std::string                               name_;
};

} // namespace hacktracker::mutation
