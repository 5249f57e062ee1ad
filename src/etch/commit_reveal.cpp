#include "etch/commit_reveal.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "runes/envelope.hpp"
#include "script/script.hpp"

namespace runeforge::etch {

namespace {

// Key-path Schnorr signature used to size the reveal before signing.
constexpr std::size_t kTaprootSignatureSize = 64;
// DER signature upper bound plus compressed pubkey for P2WPKH commits.
constexpr std::size_t kEcdsaSignatureSize = 72;
constexpr std::size_t kCompressedPubKeySize = 33;

bool SetError(EtchError* error, EtchErrorCode code, std::string message,
              bool transient = false) {
  if (error) {
    error->code = code;
    error->message = std::move(message);
    error->transient = transient;
  }
  return false;
}

EtchErrorCode CodeForCodecError(runes::CodecError code) {
  switch (code) {
    case runes::CodecError::kInvalidNameCharacter:
      return EtchErrorCode::kInvalidNameCharacter;
    case runes::CodecError::kMalformedVarInt:
      return EtchErrorCode::kMalformedVarInt;
    case runes::CodecError::kTruncatedPayload:
      return EtchErrorCode::kTruncatedPayload;
    case runes::CodecError::kNone:
    case runes::CodecError::kInvalidEtching:
      break;
  }
  return EtchErrorCode::kInvalidEtching;
}

// Maps a collaborator status onto an error. |rejected| is the code used for
// a definitive refusal.
bool SetCallError(EtchError* error, CallStatus status, EtchErrorCode rejected,
                  EtchErrorCode unavailable, const std::string& what,
                  const std::string& detail) {
  const std::string suffix = detail.empty() ? std::string() : ": " + detail;
  switch (status) {
    case CallStatus::kTimeout:
      return SetError(error, EtchErrorCode::kTimeout, what + " timed out" + suffix, true);
    case CallStatus::kUnavailable:
      return SetError(error, unavailable, what + " unavailable" + suffix, true);
    case CallStatus::kRejected:
    case CallStatus::kOk:
      break;
  }
  return SetError(error, rejected, what + " rejected" + suffix);
}

std::vector<primitives::WitnessStackItem> PlaceholderWitness(
    const std::vector<std::uint8_t>& commit_script) {
  std::uint8_t version = 0;
  std::vector<std::uint8_t> program;
  if (script::ExtractWitnessProgram(script::ScriptPubKey{commit_script}, &version, &program) &&
      version == 0 && program.size() == script::kP2WPKHProgramSize) {
    return {primitives::WitnessStackItem{std::vector<std::uint8_t>(kEcdsaSignatureSize, 0)},
            primitives::WitnessStackItem{std::vector<std::uint8_t>(kCompressedPubKeySize, 0)}};
  }
  return {primitives::WitnessStackItem{std::vector<std::uint8_t>(kTaprootSignatureSize, 0)}};
}

bool MatchesTemplate(const primitives::CTransaction& signed_tx,
                     const primitives::CTransaction& unsigned_tx, std::string* reason) {
  if (signed_tx.version != unsigned_tx.version || signed_tx.lock_time != unsigned_tx.lock_time) {
    *reason = "version or lock time changed";
    return false;
  }
  if (signed_tx.vin.size() != unsigned_tx.vin.size()) {
    *reason = "input count changed";
    return false;
  }
  for (std::size_t i = 0; i < signed_tx.vin.size(); ++i) {
    if (!(signed_tx.vin[i].prevout == unsigned_tx.vin[i].prevout) ||
        signed_tx.vin[i].sequence != unsigned_tx.vin[i].sequence) {
      *reason = "input " + std::to_string(i) + " changed";
      return false;
    }
  }
  if (signed_tx.vout != unsigned_tx.vout) {
    *reason = "outputs changed";
    return false;
  }
  if (!signed_tx.HasWitness()) {
    *reason = "transaction carries no witness";
    return false;
  }
  return true;
}

}  // namespace

std::string_view SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kAwaitingPayment:
      return "awaiting-payment";
    case SessionState::kFundingObserved:
      return "funding-observed";
    case SessionState::kRevealing:
      return "revealing";
    case SessionState::kSucceeded:
      return "succeeded";
    case SessionState::kFailed:
      return "failed";
  }
  return "unknown";
}

CommitRevealSession::CommitRevealSession(Signer signer, DataProvider provider,
                                         RevealPolicy policy)
    : signer_(std::move(signer)), provider_(std::move(provider)), policy_(std::move(policy)) {}

bool CommitRevealSession::BeginCommit(config::NetworkType network, EtchError* error) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (busy_) {
    return SetError(error, EtchErrorCode::kRevealInFlight, "another operation is in progress",
                    true);
  }
  if (state_ != SessionState::kIdle) {
    return SetError(error, EtchErrorCode::kInvalidState,
                    "commit already started (state " +
                        std::string(SessionStateName(state_)) + ")");
  }
  if (!signer_.request_key) {
    return SetError(error, EtchErrorCode::kSignerUnavailable, "no signer installed", true);
  }
  BusyScope busy(this, &lock);
  const auto timeout = policy_.signer_timeout;
  lock.unlock();

  CommitKey key;
  std::string detail;
  CallStatus status = CallStatus::kUnavailable;
  try {
    status = signer_.request_key(network, timeout, &key, &detail);
  } catch (const std::exception& ex) {
    status = CallStatus::kUnavailable;
    detail = ex.what();
  }

  lock.lock();
  if (status != CallStatus::kOk) {
    std::cerr << "[etch] warn: commit key request failed: " << detail << "\n";
    return SetCallError(error, status, EtchErrorCode::kSignerUnavailable,
                        EtchErrorCode::kSignerUnavailable, "commit key request", detail);
  }
  const auto& cfg = config::ConfigFor(network);
  script::ScriptPubKey commit_script;
  if (!script::ScriptForAddress(key.address, cfg.bech32_hrp, &commit_script)) {
    return SetError(error, EtchErrorCode::kSignerMismatch,
                    "signer returned address '" + key.address + "' which is not a " +
                        cfg.network_id + " segwit address");
  }

  CommitState commit;
  commit.network = network;
  commit.commit_address = key.address;
  commit.key_handle = std::move(key.handle);
  commit.commit_script = std::move(commit_script.data);
  commit_ = std::move(commit);
  state_ = SessionState::kAwaitingPayment;
  failed_phase_ = FailurePhase::kNone;
  std::cerr << "[etch] commit address " << commit_->commit_address << " awaiting funding on "
            << cfg.network_id << "\n";
  return true;
}

std::optional<FundingOutput> CommitRevealSession::PollFunding(std::string_view commit_address,
                                                              EtchError* error) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (busy_) {
    SetError(error, EtchErrorCode::kRevealInFlight, "another operation is in progress", true);
    return std::nullopt;
  }
  if (!commit_) {
    SetError(error, EtchErrorCode::kInvalidState, "no commit has been started");
    return std::nullopt;
  }
  if (commit_address != commit_->commit_address) {
    SetError(error, EtchErrorCode::kInvalidArgument,
             "address does not belong to this commit: " + std::string(commit_address));
    return std::nullopt;
  }
  if (commit_->funding) {
    return commit_->funding;
  }
  if (state_ == SessionState::kFailed && failed_phase_ == FailurePhase::kCommit) {
    state_ = SessionState::kAwaitingPayment;
    failed_phase_ = FailurePhase::kNone;
  }
  if (state_ != SessionState::kAwaitingPayment) {
    SetError(error, EtchErrorCode::kInvalidState,
             "cannot poll funding in state " + std::string(SessionStateName(state_)));
    return std::nullopt;
  }
  if (!provider_.list_unspent) {
    SetError(error, EtchErrorCode::kProviderUnavailable, "no data provider installed", true);
    MarkFailed(FailurePhase::kCommit);
    return std::nullopt;
  }

  BusyScope busy(this, &lock);
  const std::string address = commit_->commit_address;
  const auto network = commit_->network;
  const auto timeout = policy_.list_unspent_timeout;
  lock.unlock();

  std::vector<Utxo> utxos;
  std::string detail;
  CallStatus status = CallStatus::kUnavailable;
  try {
    status = provider_.list_unspent(address, network, timeout, &utxos, &detail);
  } catch (const std::exception& ex) {
    status = CallStatus::kUnavailable;
    detail = ex.what();
  }

  lock.lock();
  if (status != CallStatus::kOk) {
    std::cerr << "[etch] warn: listunspent for " << address << " failed: " << detail << "\n";
    SetCallError(error, status, EtchErrorCode::kProviderUnavailable,
                 EtchErrorCode::kProviderUnavailable, "listunspent", detail);
    MarkFailed(FailurePhase::kCommit);
    return std::nullopt;
  }

  const Utxo* best = nullptr;
  for (const auto& utxo : utxos) {
    if (!utxo.confirmed || utxo.value == 0) {
      continue;
    }
    primitives::Hash256 txid{};
    if (!primitives::TxIdFromHex(utxo.txid, &txid)) {
      std::cerr << "[etch] warn: ignoring output with malformed txid '" << utxo.txid << "'\n";
      continue;
    }
    if (best == nullptr || utxo.value > best->value) {
      best = &utxo;
    }
  }
  if (best == nullptr) {
    SetError(error, EtchErrorCode::kPendingFunding,
             "no confirmed output pays " + address + " yet", true);
    return std::nullopt;
  }

  FundingOutput funding{best->txid, best->vout, best->value};
  commit_->funding = funding;
  state_ = SessionState::kFundingObserved;
  std::cerr << "[etch] funding observed " << funding.txid << ":" << funding.vout
            << " value=" << funding.value << "\n";
  return funding;
}

std::optional<RevealResult> CommitRevealSession::BuildReveal(const runes::EtchingSpec& etching,
                                                             double fee_rate_sat_per_vb,
                                                             std::string_view recipient_address,
                                                             EtchError* error) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (busy_) {
    SetError(error, EtchErrorCode::kRevealInFlight, "another operation is in progress", true);
    return std::nullopt;
  }
  const bool retrying = state_ == SessionState::kFailed && failed_phase_ == FailurePhase::kReveal;
  if (state_ != SessionState::kFundingObserved && !retrying) {
    SetError(error, EtchErrorCode::kInvalidState,
             "cannot build reveal in state " + std::string(SessionStateName(state_)));
    return std::nullopt;
  }
  if (retrying && pending_ && pending_->outcome_unknown) {
    SetError(error, EtchErrorCode::kRevealInFlight,
             "previous broadcast timed out; retry the broadcast instead of rebuilding", true);
    return std::nullopt;
  }

  // Validation: nothing below touches the session state.
  if (!std::isfinite(fee_rate_sat_per_vb) || fee_rate_sat_per_vb <= 0.0 ||
      fee_rate_sat_per_vb > policy_.max_fee_rate) {
    SetError(error, EtchErrorCode::kInvalidArgument,
             "fee rate must be positive and at most " + std::to_string(policy_.max_fee_rate));
    return std::nullopt;
  }
  const auto& cfg = config::ConfigFor(commit_->network);
  script::ScriptPubKey recipient_script;
  if (!script::ScriptForAddress(recipient_address, cfg.bech32_hrp, &recipient_script)) {
    SetError(error, EtchErrorCode::kInvalidArgument,
             "recipient is not a " + cfg.network_id + " segwit address: " +
                 std::string(recipient_address));
    return std::nullopt;
  }
  const std::string& fee_address =
      policy_.service_fee_address.empty() ? cfg.service_fee_address : policy_.service_fee_address;
  script::ScriptPubKey fee_script;
  if (!script::ScriptForAddress(fee_address, cfg.bech32_hrp, &fee_script)) {
    SetError(error, EtchErrorCode::kInvalidArgument,
             "service fee address is not a " + cfg.network_id + " segwit address");
    return std::nullopt;
  }
  std::vector<runes::TaggedField> fields;
  runes::CodecError codec = runes::CodecError::kNone;
  std::string codec_message;
  if (!runes::BuildTaggedFields(etching, &fields, &codec, &codec_message)) {
    SetError(error, CodeForCodecError(codec), codec_message);
    return std::nullopt;
  }

  if (retrying) {
    // A definitive rejection: the kept transaction is dead.
    pending_.reset();
    state_ = SessionState::kFundingObserved;
    failed_phase_ = FailurePhase::kNone;
  }
  state_ = SessionState::kRevealing;

  // The framed script must read back to the same fields before anything is
  // signed.
  const auto payload = runes::SerializeFields(fields);
  const auto runestone_script = runes::CreateRunestoneOutputScript(payload);
  {
    std::vector<std::uint8_t> framed_payload;
    std::vector<runes::TaggedField> parsed;
    runes::EtchingSpec deciphered;
    std::string reason;
    if (!runes::ParseEnvelopeScript(runestone_script.data, &framed_payload) ||
        !runes::ParseFields(framed_payload, &parsed, &codec) || parsed != fields ||
        !runes::DecodeEtching(parsed, &deciphered, &codec, &reason)) {
      MarkFailed(FailurePhase::kReveal);
      SetError(error, EtchErrorCode::kMalformedPayload,
               "runestone does not survive framing" + (reason.empty() ? "" : ": " + reason));
      return std::nullopt;
    }
  }

  const FundingOutput funding = *commit_->funding;
  primitives::CTransaction tx;
  tx.version = 2;
  primitives::CTxIn input;
  if (!primitives::TxIdFromHex(funding.txid, &input.prevout.txid)) {
    MarkFailed(FailurePhase::kReveal);
    SetError(error, EtchErrorCode::kInvalidState, "funding txid is malformed");
    return std::nullopt;
  }
  input.prevout.index = funding.vout;
  input.sequence = primitives::kSequenceRbf;
  tx.vin.push_back(std::move(input));
  tx.vout.push_back(primitives::CTxOut{0, runestone_script.data});
  tx.vout.push_back(primitives::CTxOut{0, fee_script.data});
  tx.vout.push_back(primitives::CTxOut{0, recipient_script.data});

  primitives::CTransaction sizing = tx;
  sizing.vin[0].witness_stack = PlaceholderWitness(commit_->commit_script);
  const std::uint64_t estimated_vsize = primitives::serialize::TransactionVirtualSize(sizing);

  policy::FeeSplit split;
  std::string split_error;
  if (!policy::ComputeRevealSplit(funding.value, estimated_vsize, fee_rate_sat_per_vb,
                                  policy_.service_fee, policy_.dust_threshold, &split,
                                  &split_error)) {
    MarkFailed(FailurePhase::kReveal);
    std::cerr << "[etch] warn: reveal not built: " << split_error << "\n";
    SetError(error, EtchErrorCode::kInsufficientFunds, split_error);
    return std::nullopt;
  }
  tx.vout[1].value = split.service_fee;
  tx.vout[2].value = split.recipient_value;
  std::cerr << "[etch] reveal vsize=" << estimated_vsize << " miner_fee=" << split.miner_fee
            << " service_fee=" << split.service_fee << " recipient=" << split.recipient_value
            << "\n";

  std::string policy_reason;
  if (!policy::IsStandardReveal(tx, policy_.dust_threshold, &policy_reason)) {
    MarkFailed(FailurePhase::kReveal);
    SetError(error, EtchErrorCode::kPolicyViolation, policy_reason);
    return std::nullopt;
  }

  if (!signer_.sign) {
    MarkFailed(FailurePhase::kReveal);
    SetError(error, EtchErrorCode::kSignerUnavailable, "no signer installed", true);
    return std::nullopt;
  }

  SigningRequest request;
  request.network = commit_->network;
  request.key = commit_->key_handle;
  request.unsigned_tx = tx;
  request.spent_outputs.push_back(primitives::CTxOut{funding.value, commit_->commit_script});

  BusyScope busy(this, &lock);
  const auto timeout = policy_.signer_timeout;
  lock.unlock();

  std::vector<std::uint8_t> signed_raw;
  std::string detail;
  CallStatus status = CallStatus::kUnavailable;
  try {
    status = signer_.sign(request, timeout, &signed_raw, &detail);
  } catch (const std::exception& ex) {
    status = CallStatus::kUnavailable;
    detail = ex.what();
  }

  lock.lock();
  if (status != CallStatus::kOk) {
    MarkFailed(FailurePhase::kReveal);
    std::cerr << "[etch] warn: reveal signing failed: " << detail << "\n";
    SetCallError(error, status, EtchErrorCode::kSignerUnavailable,
                 EtchErrorCode::kSignerUnavailable, "reveal signing", detail);
    return std::nullopt;
  }

  primitives::CTransaction signed_tx;
  std::size_t offset = 0;
  std::string mismatch;
  if (!primitives::serialize::DeserializeTransaction(signed_raw, &offset, &signed_tx) ||
      offset != signed_raw.size()) {
    mismatch = "signed transaction does not deserialize";
  } else if (!MatchesTemplate(signed_tx, tx, &mismatch)) {
    mismatch = "signed transaction differs from template: " + mismatch;
  }
  if (!mismatch.empty()) {
    MarkFailed(FailurePhase::kReveal);
    SetError(error, EtchErrorCode::kSignerMismatch, mismatch);
    return std::nullopt;
  }

  PendingBroadcast pending;
  pending.raw_tx = std::move(signed_raw);
  pending.result.txid = primitives::TxIdToHex(primitives::ComputeTxId(signed_tx));
  pending.result.miner_fee = split.miner_fee;
  pending.result.service_fee = split.service_fee;
  pending.result.total_fee = split.TotalFee();
  pending.result.recipient_value = split.recipient_value;
  pending.result.virtual_size = primitives::serialize::TransactionVirtualSize(signed_tx);
  pending_ = std::move(pending);

  return BroadcastPending(&lock, error);
}

std::optional<RevealResult> CommitRevealSession::RetryBroadcast(EtchError* error) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (busy_) {
    SetError(error, EtchErrorCode::kRevealInFlight, "another operation is in progress", true);
    return std::nullopt;
  }
  if (state_ != SessionState::kFailed || failed_phase_ != FailurePhase::kReveal || !pending_) {
    SetError(error, EtchErrorCode::kInvalidState, "no signed reveal awaiting broadcast");
    return std::nullopt;
  }
  BusyScope busy(this, &lock);
  state_ = SessionState::kRevealing;
  failed_phase_ = FailurePhase::kNone;
  return BroadcastPending(&lock, error);
}

std::optional<RevealResult> CommitRevealSession::BroadcastPending(
    std::unique_lock<std::mutex>* lock, EtchError* error) {
  if (!provider_.broadcast) {
    pending_->outcome_unknown = false;
    MarkFailed(FailurePhase::kReveal);
    SetError(error, EtchErrorCode::kProviderUnavailable, "no data provider installed", true);
    return std::nullopt;
  }
  const std::vector<std::uint8_t> raw = pending_->raw_tx;
  const auto network = commit_->network;
  const auto timeout = policy_.broadcast_timeout;
  lock->unlock();

  std::string reported_txid;
  std::string detail;
  CallStatus status = CallStatus::kUnavailable;
  // A provider that throws may already have sent the transaction.
  bool threw = false;
  try {
    status = provider_.broadcast(raw, network, timeout, &reported_txid, &detail);
  } catch (const std::exception& ex) {
    status = CallStatus::kUnavailable;
    detail = ex.what();
    threw = true;
  }

  lock->lock();
  if (status != CallStatus::kOk) {
    pending_->outcome_unknown = status == CallStatus::kTimeout || threw;
    MarkFailed(FailurePhase::kReveal);
    std::cerr << "[etch] warn: broadcast of " << pending_->result.txid << " failed: " << detail
              << "\n";
    SetCallError(error, status, EtchErrorCode::kBroadcastRejected,
                 EtchErrorCode::kProviderUnavailable, "broadcast", detail);
    return std::nullopt;
  }
  if (!reported_txid.empty() && reported_txid != pending_->result.txid) {
    std::cerr << "[etch] warn: provider reported txid " << reported_txid << ", expected "
              << pending_->result.txid << "\n";
  }
  result_ = pending_->result;
  pending_.reset();
  state_ = SessionState::kSucceeded;
  failed_phase_ = FailurePhase::kNone;
  std::cerr << "[etch] reveal broadcast " << result_->txid << " total_fee=" << result_->total_fee
            << "\n";
  if (error) *error = EtchError{};
  return result_;
}

void CommitRevealSession::MarkFailed(FailurePhase phase) {
  state_ = SessionState::kFailed;
  failed_phase_ = phase;
}

SessionState CommitRevealSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

FailurePhase CommitRevealSession::failed_phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_phase_;
}

std::optional<CommitState> CommitRevealSession::commit_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return commit_;
}

std::optional<RevealResult> CommitRevealSession::result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

bool CommitRevealSession::HasPendingBroadcast() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.has_value();
}

}  // namespace runeforge::etch
