#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/network.hpp"
#include "etch/data_provider.hpp"
#include "etch/etch_error.hpp"
#include "etch/signer.hpp"
#include "policy/reveal_fees.hpp"
#include "policy/standardness.hpp"
#include "primitives/amount.hpp"
#include "primitives/transaction.hpp"
#include "runes/runestone.hpp"

namespace runeforge::etch {

enum class SessionState {
  kIdle,
  kAwaitingPayment,
  kFundingObserved,
  kRevealing,
  kSucceeded,
  kFailed,
};

enum class FailurePhase {
  kNone,
  kCommit,  // Polling again returns to AwaitingPayment.
  kReveal,  // Funding is kept; the reveal may be rebuilt or rebroadcast.
};

std::string_view SessionStateName(SessionState state);

struct RevealPolicy {
  primitives::Amount dust_threshold{policy::kDustThreshold};
  policy::ServiceFeeSchedule service_fee{};
  // Overrides the network's collection address when non-empty.
  std::string service_fee_address;
  std::chrono::milliseconds list_unspent_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds signer_timeout{std::chrono::seconds(15)};
  std::chrono::milliseconds broadcast_timeout{std::chrono::seconds(15)};
  // Upper bound on the caller-supplied fee rate, in sat/vB.
  double max_fee_rate{1'000.0};
};

struct FundingOutput {
  std::string txid;
  std::uint32_t vout{0};
  primitives::Amount value{0};
};

struct CommitState {
  config::NetworkType network{config::NetworkType::kMainnet};
  std::string commit_address;
  KeyHandle key_handle;
  std::vector<std::uint8_t> commit_script;
  std::optional<FundingOutput> funding;
};

struct RevealResult {
  std::string txid;
  primitives::Amount total_fee{0};
  primitives::Amount miner_fee{0};
  primitives::Amount service_fee{0};
  primitives::Amount recipient_value{0};
  std::uint64_t virtual_size{0};
};

// Drives one etching through commit, funding and reveal. The session owns
// no timers: callers decide when to poll. External calls are made without
// holding the session lock, and only one operation runs at a time.
//
// A session is bound to a single commit key and is not reused once the
// reveal succeeds.
class CommitRevealSession {
 public:
  CommitRevealSession(Signer signer, DataProvider provider, RevealPolicy policy = {});

  CommitRevealSession(const CommitRevealSession&) = delete;
  CommitRevealSession& operator=(const CommitRevealSession&) = delete;

  // Idle -> AwaitingPayment. On failure the session stays Idle.
  bool BeginCommit(config::NetworkType network, EtchError* error);

  // Looks for a confirmed output paying |commit_address|. While nothing is
  // confirmed the session stays in AwaitingPayment and |error| reports
  // kPendingFunding. The largest output wins; ties go to the first one the
  // provider listed.
  std::optional<FundingOutput> PollFunding(std::string_view commit_address, EtchError* error);

  // Builds, signs and broadcasts the reveal. Validation failures leave the
  // state untouched; every later failure moves the session to Failed with
  // the funding kept.
  std::optional<RevealResult> BuildReveal(const runes::EtchingSpec& etching,
                                          double fee_rate_sat_per_vb,
                                          std::string_view recipient_address,
                                          EtchError* error);

  // Re-submits the signed reveal kept from a failed broadcast.
  std::optional<RevealResult> RetryBroadcast(EtchError* error);

  SessionState state() const;
  FailurePhase failed_phase() const;
  std::optional<CommitState> commit_state() const;
  std::optional<RevealResult> result() const;
  bool HasPendingBroadcast() const;

 private:
  struct PendingBroadcast {
    std::vector<std::uint8_t> raw_tx;
    RevealResult result;
    // The last attempt timed out or threw, so the transaction may already be
    // in the mempool.
    bool outcome_unknown{false};
  };

  // Clears busy_ on scope exit, re-acquiring the lock if needed.
  class BusyScope {
   public:
    BusyScope(CommitRevealSession* session, std::unique_lock<std::mutex>* lock)
        : session_(session), lock_(lock) {
      session_->busy_ = true;
    }
    ~BusyScope() {
      if (!lock_->owns_lock()) lock_->lock();
      session_->busy_ = false;
    }
    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

   private:
    CommitRevealSession* session_;
    std::unique_lock<std::mutex>* lock_;
  };

  std::optional<RevealResult> BroadcastPending(std::unique_lock<std::mutex>* lock,
                                               EtchError* error);
  void MarkFailed(FailurePhase phase);

  Signer signer_;
  DataProvider provider_;
  RevealPolicy policy_;

  mutable std::mutex mutex_;
  bool busy_{false};
  SessionState state_{SessionState::kIdle};
  FailurePhase failed_phase_{FailurePhase::kNone};
  std::optional<CommitState> commit_;
  std::optional<PendingBroadcast> pending_;
  std::optional<RevealResult> result_;
};

}  // namespace runeforge::etch
