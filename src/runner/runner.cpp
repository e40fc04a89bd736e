/// @file runner.cpp
/// @brief Runner start-up and teardown.

#include "runner/runner.hpp"

#include "common/error.hpp"
#include "runner/pacer.hpp"

#include <utility>

namespace loadgen {

Runner::Runner(std::string target, LoadTestArgs args)
    : target_{std::move(target)}, args_{std::move(args)} {}

Runner::~Runner() {
  if (!dispatch_thread_.joinable()) {
    return;
  }
  lifecycle_.stop();
  // Workers block on a full sink until someone receives.
  while (results_->receive().has_value()) {
  }
  dispatch_thread_.join();
}

auto Runner::start_test() -> std::expected<ResultStream, std::error_code> {
  if (dispatcher_ != nullptr) {
    return std::unexpected(make_error_code(errc::already_started));
  }

  auto args = validate(args_);
  if (!args.has_value()) {
    return std::unexpected(args.error());
  }
  auto pacer = Pacer::create(args->qps);
  if (!pacer.has_value()) {
    return std::unexpected(pacer.error());
  }

  results_ = std::make_shared<Channel<Result>>();
  dispatcher_ = std::make_unique<Dispatcher>(target_, std::move(*args), *pacer,
                                             lifecycle_, *results_);
  dispatch_thread_ = std::thread([dispatcher = dispatcher_.get()] {
    dispatcher->run();
  });
  return ResultStream{results_};
}

auto Runner::worker_count() const noexcept -> std::uint64_t {
  return dispatcher_ != nullptr ? dispatcher_->worker_count() : 0;
}

} // namespace loadgen
