/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/core.hpp"

#include <algorithm>

#include <qtils/visit_in_place.hpp>

#include "dag/genesis.hpp"

namespace weave::primary {

  namespace {
    const Header &headerOf(const std::variant<Header, Certificate> &vertex) {
      if (auto header = std::get_if<Header>(&vertex)) {
        return *header;
      }
      return std::get<Certificate>(vertex).header;
    }
  }  // namespace

  std::string_view toString(Outcome outcome) {
    switch (outcome) {
      case Outcome::Accepted:
        return "accepted";
      case Outcome::Duplicate:
        return "duplicate";
      case Outcome::Suspended:
        return "suspended";
      case Outcome::RejectedPermanent:
        return "rejected";
      case Outcome::RejectedTransient:
        return "rejected for now";
    }
    return "unknown";
  }

  std::string_view toString(Reason reason) {
    switch (reason) {
      case Reason::None:
        return "none";
      case Reason::WrongEpoch:
        return "wrong epoch";
      case Reason::UnknownAuthority:
        return "unknown authority";
      case Reason::BadSignature:
        return "bad signature";
      case Reason::Malformed:
        return "malformed";
      case Reason::GenesisRound:
        return "genesis round";
      case Reason::Stale:
        return "garbage collected round";
      case Reason::TooFarAhead:
        return "too far ahead";
      case Reason::Equivocation:
        return "equivocation";
      case Reason::VotedLaterRound:
        return "already voted at a later round";
      case Reason::MissingParents:
        return "missing parents";
      case Reason::WrongParentRound:
        return "parent of wrong round";
      case Reason::ParentsBelowQuorum:
        return "parents below quorum";
      case Reason::QuorumNotReached:
        return "signers below quorum";
      case Reason::ConflictingCertificate:
        return "conflicting certificate";
      case Reason::AlreadyCertified:
        return "already certified";
      case Reason::AlreadyVoted:
        return "already voted";
      case Reason::AlreadySuspended:
        return "already suspended";
      case Reason::PendingFull:
        return "too many suspended vertices";
      case Reason::LocalFault:
        return "local fault";
    }
    return "unknown";
  }

  Core::Core(qtils::SharedRef<log::LoggingSystem> logsys,
             Parameters params,
             CommitteePtr committee,
             crypto::ed25519::KeyPair keypair,
             qtils::SharedRef<dag::DagStore> store,
             qtils::SharedRef<network::PeerNetwork> network,
             qtils::SharedRef<ConsensusFeed> feed,
             qtils::SharedRef<EvidenceLog> evidence,
             qtils::SharedRef<clock::SteadyClock> clock,
             Channel<CoreMessage>::Receiver inbox,
             Channel<SynchronizerMessage>::Sender synchronizer,
             Channel<ProposerMessage>::Sender proposer,
             FatalHandler on_fatal)
      : logger_(logsys->getLogger("Core", "core")),
        params_(params),
        committee_(std::move(committee)),
        keypair_(keypair),
        self_(crypto::ed25519::publicKey(keypair)),
        store_(std::move(store)),
        network_(std::move(network)),
        feed_(std::move(feed)),
        evidence_(std::move(evidence)),
        clock_(std::move(clock)),
        inbox_(std::move(inbox)),
        synchronizer_(std::move(synchronizer)),
        proposer_(std::move(proposer)),
        on_fatal_(std::move(on_fatal)),
        dag_(committee_),
        aggregator_(committee_),
        last_tick_(clock_->now()),
        last_advance_(last_tick_),
        last_stall_alert_(last_tick_) {
    for (auto &certificate : dag::genesisCertificates(*committee_)) {
      genesis_.insert(certificate.digest());
    }
  }

  bool Core::recover() {
    auto markers_res = store_->markers();
    if (markers_res.has_error()) {
      fatal("Reading round markers", markers_res.error());
      return false;
    }
    auto markers = markers_res.value();
    round_ = markers.round;
    gc_round_ = markers.gc_round;
    persisted_acked_round_ = markers.acked_round;
    feed_->resetAckedRound(markers.acked_round);

    if (gc_round_ == kGenesisRound) {
      for (auto &certificate : dag::genesisCertificates(*committee_)) {
        dag_.insert(std::make_shared<const Certificate>(std::move(certificate)));
      }
    }

    auto certificates_res = store_->certificatesAfter(gc_round_);
    if (certificates_res.has_error()) {
      fatal("Loading certificates", certificates_res.error());
      return false;
    }
    for (auto &certificate : certificates_res.value()) {
      certificate.header.updateDigest();
      auto vertex = std::make_shared<const Certificate>(std::move(certificate));
      if (not dag_.insert(vertex)) {
        SL_WARN(logger_,
                "Stored certificate {:0x} conflicts with another one of {} at "
                "round {}",
                vertex->digest(),
                committee_->nameOf(vertex->origin()),
                vertex->round());
        continue;
      }
      if (vertex->round() > markers.acked_round) {
        redelivery_.emplace_back(std::move(vertex));
      }
    }

    auto votes_res = store_->lastVotes();
    if (votes_res.has_error()) {
      fatal("Loading vote records", votes_res.error());
      return false;
    }
    for (auto &[origin, last] : votes_res.value()) {
      last_voted_[origin] = last.round;
      if (not evicted(last.round)) {
        voted_.emplace(SlotKey{last.round, origin}, last.header_digest);
      }
    }

    auto stored_round = round_;
    tryAdvanceRound();
    if (round_ == stored_round) {
      updateParents();
    }
    last_advance_ = clock_->now();
    publishSnapshot();

    SL_INFO(logger_,
            "Recovered at round {} (stored {}, gc round {}, acked round {}): "
            "{} certificates, {} to deliver again",
            round_,
            stored_round,
            gc_round_,
            markers.acked_round,
            dag_.size(),
            redelivery_.size());
    return not failed_;
  }

  void Core::start(std::shared_ptr<Watchdog> watchdog) {
    loop_.start("core", std::move(watchdog), [this] {
      if (auto message = inbox_.receiveFor(params_.tick_interval)) {
        process(std::move(message.value()));
      } else if (inbox_.isFinished()) {
        loop_.requestStop();
        return;
      }
      auto now = clock_->now();
      if (now - last_tick_ >= params_.tick_interval) {
        last_tick_ = now;
        tick();
      }
    });
  }

  void Core::stop() {
    inbox_.close();
    loop_.stop();
  }

  void Core::process(CoreMessage message) {
    if (failed_) {
      return;
    }
    redeliver();
    qtils::visit_in_place(
        message,
        [&](network::Envelope &envelope) { onEnvelope(std::move(envelope)); },
        [&](const OwnHeader &own) { onOwnHeader(own.header); },
        [&](FetchedCertificates &fetched) {
          onFetchedCertificates(std::move(fetched));
        },
        [&](const FetchedHeaders &fetched) { onFetchedHeaders(fetched); },
        [&](const FetchUnavailable &unavailable) {
          onUnavailable(unavailable);
        });
    drainReady();
    flushOutbox();
    publishSnapshot();
  }

  void Core::tick() {
    if (failed_) {
      return;
    }
    redeliver();
    auto now = clock_->now();

    std::vector<Digest> expired;
    for (auto &[key, entry] : suspended_) {
      if (entry.deadline <= now) {
        expired.emplace_back(key);
      }
    }
    for (auto &key : expired) {
      dropSuspended(key, "parents not received in time");
    }

    collectGarbage();
    auto acked_round = feed_->ackedRound();
    if (not failed_ and acked_round > persisted_acked_round_) {
      if (auto res = store_->writeAckedRound(acked_round); res.has_error()) {
        fatal("Persisting acked round", res.error());
        return;
      }
      persisted_acked_round_ = acked_round;
    }

    drainReady();
    flushOutbox();

    auto threshold = params_.stall_alert_threshold;
    if (now - last_advance_ >= threshold
        and now - last_stall_alert_ >= threshold) {
      last_stall_alert_ = now;
      SL_ERROR(logger_,
               "No round progress for {} s, stuck at round {} with {} "
               "suspended vertices",
               std::chrono::duration_cast<std::chrono::seconds>(
                   now - last_advance_)
                   .count(),
               round_,
               suspended_.size());
    }
    publishSnapshot();
  }

  void Core::onEnvelope(network::Envelope envelope) {
    auto &from = envelope.from;
    qtils::visit_in_place(
        envelope.message,
        [&](network::SendHeader &message) {
          message.header.updateDigest();
          logResult("header",
                    message.header,
                    handleHeader(message.header, from));
        },
        [&](const network::SendVote &message) {
          auto result = handleVote(message.vote);
          SL_TRACE(logger_,
                   "Vote of {} for {} at round {}: {} ({})",
                   committee_->nameOf(message.vote.author),
                   committee_->nameOf(message.vote.origin),
                   message.vote.round,
                   toString(result.outcome),
                   toString(result.reason));
        },
        [&](network::SendCertificate &message) {
          message.certificate.header.updateDigest();
          logResult("certificate",
                    message.certificate.header,
                    handleCertificate(message.certificate, from));
        },
        [&](const auto &) {
          SL_TRACE(logger_,
                   "Message from {} is not for core",
                   committee_->nameOf(from));
        });
  }

  void Core::onOwnHeader(const Header &header) {
    header.updateDigest();
    network_->broadcast(network::SendHeader{.header = header});
    logResult("own header", header, handleHeader(header, self_));
  }

  void Core::onFetchedCertificates(FetchedCertificates fetched) {
    auto &certificates = fetched.certificates;
    // parents first
    std::ranges::sort(certificates, [](const auto &lhs, const auto &rhs) {
      return std::tie(lhs.header.round, lhs.header.author)
           < std::tie(rhs.header.round, rhs.header.author);
    });
    for (auto &certificate : certificates) {
      certificate.header.updateDigest();
      auto digest = certificate.digest();
      auto result = handleCertificate(certificate, fetched.from);
      logResult("fetched certificate", certificate.header, result);
      if (result.outcome == Outcome::RejectedPermanent
          and waiters_.contains(digest)) {
        SL_WARN(logger_,
                "{} served an invalid certificate {:0x}, fetching it again",
                committee_->nameOf(fetched.from),
                digest);
        requestFetch(
            FetchKind::Certificates, {digest}, certificate.origin(), self_);
      }
    }
  }

  void Core::onFetchedHeaders(const FetchedHeaders &fetched) {
    for (auto &header : fetched.headers) {
      header.updateDigest();
      if (auto reason = validateHeader(header); reason != Reason::None) {
        SL_DEBUG(logger_,
                 "Fetched header {:0x} from {} is invalid: {}",
                 header.digest(),
                 committee_->nameOf(fetched.from),
                 toString(reason));
        continue;
      }
      if (evicted(header.round)) {
        continue;
      }
      SlotKey slot{header.round, header.author};
      auto known = knownHeader(slot);
      if (not known.has_value()) {
        fetched_headers_.emplace(slot, header);
        continue;
      }
      if (known->digest() != header.digest()) {
        SL_WARN(logger_,
                "{} signed two headers at round {}",
                committee_->nameOf(header.author),
                header.round);
        flagEquivocation(Evidence::headers(std::move(known.value()), header));
      }
    }
  }

  void Core::onUnavailable(const FetchUnavailable &unavailable) {
    if (unavailable.kind == FetchKind::Headers) {
      SL_DEBUG(logger_,
               "Header {:0x} could not be fetched",
               unavailable.digest);
      return;
    }
    auto waiters = waiters_.find(unavailable.digest);
    if (waiters == waiters_.end()) {
      return;
    }
    auto keys = waiters->second;
    SL_WARN(logger_,
            "Certificate {:0x} could not be fetched, dropping {} suspended "
            "vertices waiting for it",
            unavailable.digest,
            keys.size());
    for (auto &key : keys) {
      dropSuspended(key, "parent unavailable");
    }
    waiters_.erase(unavailable.digest);
  }

  void Core::logResult(std::string_view what,
                       const Header &header,
                       const HandleResult &result) const {
    switch (result.outcome) {
      case Outcome::Accepted:
      case Outcome::Suspended:
        SL_DEBUG(logger_,
                 "{} {:0x} of {} at round {}: {} ({})",
                 what,
                 header.digest(),
                 committee_->nameOf(header.author),
                 header.round,
                 toString(result.outcome),
                 toString(result.reason));
        break;
      case Outcome::Duplicate:
      case Outcome::RejectedTransient:
        SL_TRACE(logger_,
                 "{} {:0x} of {} at round {}: {} ({})",
                 what,
                 header.digest(),
                 committee_->nameOf(header.author),
                 header.round,
                 toString(result.outcome),
                 toString(result.reason));
        break;
      case Outcome::RejectedPermanent:
        SL_WARN(logger_,
                "{} {:0x} of {} at round {}: {} ({})",
                what,
                header.digest(),
                committee_->nameOf(header.author),
                header.round,
                toString(result.outcome),
                toString(result.reason));
        break;
    }
  }

  HandleResult Core::handleHeader(const Header &header,
                                  const AuthorityId &from) {
    if (failed_) {
      return {Outcome::RejectedTransient, Reason::LocalFault};
    }
    if (auto reason = validateHeader(header); reason != Reason::None) {
      return {Outcome::RejectedPermanent, reason};
    }
    if (evicted(header.round)) {
      return {Outcome::RejectedPermanent, Reason::Stale};
    }
    auto digest = header.digest();
    SlotKey slot{header.round, header.author};

    if (auto certified = dag_.at(header.author, header.round)) {
      if (certified->header.digest() == digest) {
        return {Outcome::Duplicate, Reason::AlreadyCertified};
      }
      return flagEquivocation(Evidence::headers(certified->header, header));
    }
    if (excluded_.contains(slot)) {
      return {Outcome::RejectedPermanent, Reason::Equivocation};
    }
    if (auto voted = voted_.find(slot); voted != voted_.end()) {
      if (voted->second == digest) {
        repeatVote(header, from);
        return {Outcome::Duplicate, Reason::AlreadyVoted};
      }
      if (auto first = knownHeader(slot)) {
        return flagEquivocation(Evidence::headers(std::move(*first), header));
      }
      excluded_.emplace(slot);
      aggregator_.exclude(header.author, header.round);
      return {Outcome::RejectedPermanent, Reason::Equivocation};
    }
    if (auto last = last_voted_.find(header.author);
        last != last_voted_.end() and header.round < last->second) {
      return {Outcome::RejectedPermanent, Reason::VotedLaterRound};
    }
    if (suspended_.contains(digest)) {
      return {Outcome::Suspended, Reason::AlreadySuspended};
    }

    if (not evicted(header.round - 1)) {
      auto missing = missingParents(header);
      if (not missing.empty()) {
        auto reason = header.round > round_ + params_.max_round_lookahead
                        ? Reason::TooFarAhead
                        : Reason::MissingParents;
        return suspend(header, digest, from, std::move(missing), reason);
      }
      if (auto reason = validateParents(header); reason != Reason::None) {
        return {Outcome::RejectedPermanent, reason};
      }
    }

    // the record must be durable before the vote leaves this node
    if (auto res = store_->putVotedHeader(header); res.has_error()) {
      fatal("Persisting voted header", res.error());
      return {Outcome::RejectedTransient, Reason::LocalFault};
    }
    voted_.emplace(slot, digest);
    last_voted_[header.author] = header.round;
    fetched_headers_.erase(slot);

    auto vote = makeVote(header);
    if (not vote.has_value()) {
      return {Outcome::RejectedTransient, Reason::LocalFault};
    }
    if (auto certificate = aggregator_.addHeader(header)) {
      onCertificateFormed(std::move(certificate.value()));
    }
    network_->broadcast(network::SendVote{.vote = vote.value()});
    handleVote(vote.value());
    return {Outcome::Accepted};
  }

  HandleResult Core::handleVote(const Vote &vote) {
    if (failed_) {
      return {Outcome::RejectedTransient, Reason::LocalFault};
    }
    if (vote.epoch != committee_->epoch()) {
      return {Outcome::RejectedPermanent, Reason::WrongEpoch};
    }
    if (not committee_->contains(vote.author)
        or not committee_->contains(vote.origin)) {
      return {Outcome::RejectedPermanent, Reason::UnknownAuthority};
    }
    if (vote.round == kGenesisRound) {
      return {Outcome::RejectedPermanent, Reason::GenesisRound};
    }
    if (evicted(vote.round)) {
      return {Outcome::RejectedPermanent, Reason::Stale};
    }
    if (vote.round > round_ + params_.max_round_lookahead) {
      return {Outcome::RejectedTransient, Reason::TooFarAhead};
    }
    if (dag_.at(vote.origin, vote.round)) {
      return {Outcome::Duplicate, Reason::AlreadyCertified};
    }
    if (not crypto::ed25519::verify(
            vote.signature, vote.certificateDigest(), vote.author)) {
      return {Outcome::RejectedPermanent, Reason::BadSignature};
    }

    auto result = aggregator_.append(vote);
    using Status = VoteAggregator::Status;

    SlotKey slot{vote.round, vote.origin};
    auto voted = voted_.find(slot);
    auto unknown_digest = result.conflicting_digest
                       or (voted != voted_.end()
                           and voted->second != vote.header_digest);
    if (unknown_digest and result.status != Status::Equivocation
        and not fetched_headers_.contains(slot)) {
      // the header behind the other digest proves or clears equivocation
      requestFetch(
          FetchKind::Headers, {vote.header_digest}, vote.author, vote.author);
    }

    switch (result.status) {
      case Status::Pending:
        return {Outcome::Accepted};
      case Status::Duplicate:
        return {Outcome::Duplicate};
      case Status::Equivocation:
        if (result.previous.has_value()) {
          evidence_->record(
              Evidence::votes(std::move(result.previous.value()), vote));
        }
        return {Outcome::RejectedPermanent, Reason::Equivocation};
      case Status::Excluded:
        return {Outcome::RejectedPermanent, Reason::Equivocation};
      case Status::Stale:
        return {Outcome::RejectedPermanent, Reason::Stale};
      case Status::QuorumReached:
        if (result.certificate.has_value()) {
          onCertificateFormed(std::move(result.certificate.value()));
        }
        return {Outcome::Accepted};
    }
    return {Outcome::RejectedPermanent, Reason::Malformed};
  }

  HandleResult Core::handleCertificate(const Certificate &certificate,
                                       const AuthorityId &from) {
    if (failed_) {
      return {Outcome::RejectedTransient, Reason::LocalFault};
    }
    auto digest = certificate.digest();
    if (certificate.isGenesis()) {
      if (genesis_.contains(digest)) {
        return {Outcome::Duplicate, Reason::AlreadyCertified};
      }
      return {Outcome::RejectedPermanent, Reason::GenesisRound};
    }
    auto &header = certificate.header;
    if (auto reason = validateHeader(header); reason != Reason::None) {
      return {Outcome::RejectedPermanent, reason};
    }
    if (evicted(header.round)) {
      return {Outcome::RejectedPermanent, Reason::Stale};
    }
    if (dag_.contains(digest)) {
      return {Outcome::Duplicate, Reason::AlreadyCertified};
    }
    if (suspended_.contains(digest)) {
      return {Outcome::Suspended, Reason::AlreadySuspended};
    }
    if (auto reason = validateSigners(certificate, digest);
        reason != Reason::None) {
      return {Outcome::RejectedPermanent, reason};
    }
    if (auto existing = dag_.at(header.author, header.round)) {
      evidence_->record(Evidence::certificates(*existing, certificate));
      return {Outcome::RejectedPermanent, Reason::ConflictingCertificate};
    }

    if (not evicted(header.round - 1)) {
      auto missing = missingParents(header);
      if (not missing.empty()) {
        auto reason = header.round > round_ + params_.max_round_lookahead
                        ? Reason::TooFarAhead
                        : Reason::MissingParents;
        return suspend(certificate, digest, from, std::move(missing), reason);
      }
      if (auto reason = validateParents(header); reason != Reason::None) {
        return {Outcome::RejectedPermanent, reason};
      }
    }

    if (not insertCertificate(certificate)) {
      return {Outcome::RejectedTransient, Reason::LocalFault};
    }
    return {Outcome::Accepted};
  }

  Reason Core::validateHeader(const Header &header) const {
    if (header.epoch != committee_->epoch()) {
      return Reason::WrongEpoch;
    }
    if (not committee_->contains(header.author)) {
      return Reason::UnknownAuthority;
    }
    if (header.round == kGenesisRound) {
      return Reason::GenesisRound;
    }
    if (header.parents.empty()) {
      return Reason::Malformed;
    }
    std::set<Digest> parents(header.parents.begin(), header.parents.end());
    if (parents.size() != header.parents.size()) {
      return Reason::Malformed;
    }
    if (not crypto::ed25519::verify(
            header.signature, header.digest(), header.author)) {
      return Reason::BadSignature;
    }
    return Reason::None;
  }

  Reason Core::validateSigners(const Certificate &certificate,
                               const Digest &digest) const {
    auto &signers = certificate.signers;
    auto &signatures = certificate.signatures;
    if (signers.empty() or signers.size() != signatures.size()) {
      return Reason::Malformed;
    }
    // strictly ascending, hence distinct
    auto unordered = std::adjacent_find(
        signers.begin(), signers.end(), [](const auto &lhs, const auto &rhs) {
          return not(lhs < rhs);
        });
    if (unordered != signers.end()) {
      return Reason::Malformed;
    }
    for (auto &signer : signers) {
      if (not committee_->contains(signer)) {
        return Reason::UnknownAuthority;
      }
    }
    if (committee_->stakeOf(signers) < committee_->quorumThreshold()) {
      return Reason::QuorumNotReached;
    }
    auto signature = signatures.begin();
    for (auto &signer : signers) {
      if (not crypto::ed25519::verify(*signature, digest, signer)) {
        return Reason::BadSignature;
      }
      ++signature;
    }
    return Reason::None;
  }

  Reason Core::validateParents(const Header &header) const {
    std::vector<AuthorityId> authors;
    authors.reserve(header.parents.size());
    for (auto &parent : header.parents) {
      auto certificate = dag_.get(parent);
      if (certificate == nullptr) {
        return Reason::MissingParents;
      }
      if (certificate->round() + 1 != header.round) {
        return Reason::WrongParentRound;
      }
      authors.emplace_back(certificate->origin());
    }
    if (committee_->stakeOf(authors) < committee_->quorumThreshold()) {
      return Reason::ParentsBelowQuorum;
    }
    return Reason::None;
  }

  std::vector<Digest> Core::missingParents(const Header &header) const {
    std::vector<Digest> missing;
    for (auto &parent : header.parents) {
      if (not dag_.contains(parent)) {
        missing.emplace_back(parent);
      }
    }
    return missing;
  }

  bool Core::evicted(Round round) const {
    return gc_round_ != kGenesisRound and round <= gc_round_;
  }

  std::optional<Header> Core::knownHeader(const SlotKey &slot) {
    auto &[round, author] = slot;
    if (auto certified = dag_.at(author, round)) {
      return certified->header;
    }
    if (auto voted = voted_.find(slot); voted != voted_.end()) {
      auto header_res = store_->getHeader(voted->second);
      if (header_res.has_error()) {
        fatal("Reading voted header", header_res.error());
        return std::nullopt;
      }
      if (header_res.value().has_value()) {
        return std::move(header_res.value());
      }
    }
    if (auto fetched = fetched_headers_.find(slot);
        fetched != fetched_headers_.end()) {
      return fetched->second;
    }
    return std::nullopt;
  }

  HandleResult Core::flagEquivocation(Evidence evidence) {
    SlotKey slot{evidence.round, evidence.author};
    excluded_.emplace(slot);
    aggregator_.exclude(evidence.author, evidence.round);
    evidence_->record(std::move(evidence));
    return {Outcome::RejectedPermanent, Reason::Equivocation};
  }

  std::optional<Vote> Core::makeVote(const Header &header) {
    Vote vote{
        .header_digest = header.digest(),
        .round = header.round,
        .epoch = header.epoch,
        .origin = header.author,
        .author = self_,
    };
    auto signature = crypto::ed25519::sign(keypair_, vote.certificateDigest());
    if (not signature.has_value()) {
      fatal("Signing vote", make_error_code(PrimaryError::SIGNING_FAILED));
      return std::nullopt;
    }
    vote.signature = signature.value();
    return vote;
  }

  void Core::repeatVote(const Header &header, const AuthorityId &to) {
    // ed25519 signing is deterministic: this is the same vote again
    auto vote = makeVote(header);
    if (not vote.has_value()) {
      return;
    }
    if (auto certificate = aggregator_.addHeader(header)) {
      onCertificateFormed(std::move(certificate.value()));
      return;
    }
    if (to == self_) {
      // own header handed over again after a restart
      handleVote(vote.value());
      network_->broadcast(network::SendVote{.vote = vote.value()});
      return;
    }
    network_->send(to, network::SendVote{.vote = vote.value()});
  }

  void Core::onCertificateFormed(Certificate certificate) {
    certificate.header.updateDigest();
    SL_DEBUG(logger_,
             "Certificate {:0x} formed for {} at round {} with {} signers",
             certificate.digest(),
             committee_->nameOf(certificate.origin()),
             certificate.round(),
             certificate.signers.size());
    network_->broadcast(network::SendCertificate{.certificate = certificate});
    logResult("formed certificate",
              certificate.header,
              handleCertificate(certificate, self_));
  }

  bool Core::insertCertificate(Certificate certificate) {
    certificate.header.updateDigest();
    if (auto res = store_->putCertificate(certificate); res.has_error()) {
      fatal("Persisting certificate", res.error());
      return false;
    }
    auto digest = certificate.digest();
    auto round = certificate.round();
    auto origin = certificate.origin();

    // a quorum certified another header than the one voted for here
    SlotKey slot{round, origin};
    if (auto voted = voted_.find(slot); voted != voted_.end()
        and voted->second != certificate.header.digest()) {
      if (auto first = knownHeader(slot)) {
        evidence_->record(
            Evidence::headers(std::move(*first), certificate.header));
      }
    }

    auto vertex = std::make_shared<const Certificate>(std::move(certificate));
    dag_.insert(vertex);
    aggregator_.markCertified(origin, round);
    SL_DEBUG(logger_,
             "Inserted certificate {:0x} of {} at round {}",
             digest,
             committee_->nameOf(origin),
             round);

    if (not feed_->push(vertex)) {
      SL_WARN(logger_,
              "Consensus feed is closed, certificate {:0x} is not delivered",
              digest);
    }
    if (round + 1 == round_) {
      // a late parent of the current round
      updateParents();
    }
    resolveWaiters(digest);
    tryAdvanceRound();
    drainReady();
    return not failed_;
  }

  HandleResult Core::suspend(std::variant<Header, Certificate> vertex,
                             const Digest &key,
                             const AuthorityId &from,
                             std::vector<Digest> missing,
                             Reason reason) {
    if (suspended_.size() >= params_.max_pending_vertices) {
      SL_DEBUG(logger_,
               "Suspended vertex limit {} reached",
               params_.max_pending_vertices);
      return {Outcome::RejectedTransient, Reason::PendingFull};
    }
    auto &header = headerOf(vertex);
    Suspended entry{
        .vertex = {},
        .from = from,
        .round = header.round,
        .author = header.author,
        .missing = {missing.begin(), missing.end()},
        .deadline = clock_->now() + params_.pending_timeout,
    };
    entry.vertex = std::move(vertex);
    for (auto &digest : missing) {
      waiters_[digest].insert(key);
    }
    auto author = entry.author;
    suspended_.emplace(key, std::move(entry));
    requestFetch(FetchKind::Certificates, std::move(missing), author, from);
    return {Outcome::Suspended, reason};
  }

  void Core::dropSuspended(const Digest &key, std::string_view why) {
    std::vector<Digest> queue{key};
    while (not queue.empty()) {
      auto current = queue.back();
      queue.pop_back();
      auto node = suspended_.extract(current);
      if (node.empty()) {
        continue;
      }
      auto &entry = node.mapped();
      for (auto &digest : entry.missing) {
        if (auto waiters = waiters_.find(digest); waiters != waiters_.end()) {
          waiters->second.erase(current);
          if (waiters->second.empty()) {
            waiters_.erase(waiters);
          }
        }
      }
      ready_.erase(ReadyKey{entry.round, entry.author, current});
      SL_DEBUG(logger_,
               "Dropped suspended vertex of {} at round {}: {}",
               committee_->nameOf(entry.author),
               entry.round,
               why);
      if (auto waiters = waiters_.find(current); waiters != waiters_.end()) {
        queue.insert(
            queue.end(), waiters->second.begin(), waiters->second.end());
        waiters_.erase(waiters);
      }
    }
  }

  void Core::resolveWaiters(const Digest &digest) {
    auto waiters = waiters_.extract(digest);
    if (waiters.empty()) {
      return;
    }
    for (auto &key : waiters.mapped()) {
      auto suspended = suspended_.find(key);
      if (suspended == suspended_.end()) {
        continue;
      }
      auto &entry = suspended->second;
      entry.missing.erase(digest);
      if (entry.missing.empty()) {
        ready_.emplace(entry.round, entry.author, key);
      }
    }
  }

  void Core::drainReady() {
    // vertices unblocked while draining join the same loop
    if (draining_) {
      return;
    }
    draining_ = true;
    while (not ready_.empty() and not failed_) {
      auto key = std::get<Digest>(*ready_.begin());
      ready_.erase(ready_.begin());
      auto node = suspended_.extract(key);
      if (node.empty()) {
        continue;
      }
      auto entry = std::move(node.mapped());
      qtils::visit_in_place(
          entry.vertex,
          [&](const Header &header) {
            logResult(
                "resumed header", header, handleHeader(header, entry.from));
          },
          [&](const Certificate &certificate) {
            logResult("resumed certificate",
                      certificate.header,
                      handleCertificate(certificate, entry.from));
          });
    }
    draining_ = false;
  }

  void Core::requestFetch(FetchKind kind,
                          std::vector<Digest> digests,
                          const AuthorityId &origin,
                          const AuthorityId &from) {
    FetchRequest request{
        .kind = kind,
        .digests = std::move(digests),
        .preferred = std::nullopt,
        .hints = {},
    };
    if (origin != self_) {
      request.preferred = origin;
    }
    if (from != self_ and from != origin) {
      request.hints.emplace_back(from);
    }
    if (not pending_fetches_.empty()) {
      pending_fetches_.emplace_back(std::move(request));
      return;
    }
    if (synchronizer_.trySend(request) == SendStatus::Full) {
      pending_fetches_.emplace_back(std::move(request));
    }
  }

  void Core::tryAdvanceRound() {
    if (failed_) {
      return;
    }
    auto previous = round_;
    auto quorum = committee_->quorumThreshold();
    while (dag_.roundStake(round_) >= quorum) {
      ++round_;
    }
    if (round_ == previous) {
      return;
    }
    if (auto res = store_->writeRound(round_); res.has_error()) {
      fatal("Persisting round", res.error());
      return;
    }
    last_advance_ = clock_->now();
    SL_INFO(logger_, "Advanced to round {}", round_);
    updateParents();
    collectGarbage();
  }

  void Core::updateParents() {
    if (round_ == kGenesisRound) {
      return;
    }
    ParentsReady ready{
        .round = round_,
        .parents = dag_.roundDigests(round_ - 1),
    };
    if (proposer_.trySend(ready) == SendStatus::Full) {
      pending_parents_ = std::move(ready);
    } else {
      pending_parents_.reset();
    }
  }

  void Core::collectGarbage() {
    if (failed_) {
      return;
    }
    auto depth_bound = round_ > params_.gc_depth ? round_ - params_.gc_depth
                                                 : kGenesisRound;
    auto acked_round = feed_->ackedRound();
    // nothing unacknowledged may be evicted
    auto gc_round = std::min(depth_bound, acked_round);
    if (gc_round <= gc_round_) {
      return;
    }
    if (auto res = store_->collectGarbage(gc_round, acked_round);
        res.has_error()) {
      fatal("Collecting garbage", res.error());
      return;
    }
    persisted_acked_round_ = std::max(persisted_acked_round_, acked_round);
    gc_round_ = gc_round;

    auto pruned = dag_.prune(gc_round);
    aggregator_.collectGarbage(gc_round);
    std::erase_if(voted_,
                  [&](const auto &entry) { return entry.first.first <= gc_round; });
    std::erase_if(fetched_headers_,
                  [&](const auto &entry) { return entry.first.first <= gc_round; });
    std::erase_if(excluded_,
                  [&](const SlotKey &slot) { return slot.first <= gc_round; });

    // parents at evicted rounds count as present
    std::vector<Digest> stale;
    for (auto &[key, entry] : suspended_) {
      if (entry.round <= gc_round) {
        stale.emplace_back(key);
        continue;
      }
      if (entry.round - 1 <= gc_round and not entry.missing.empty()) {
        for (auto &digest : entry.missing) {
          if (auto waiters = waiters_.find(digest); waiters != waiters_.end()) {
            waiters->second.erase(key);
            if (waiters->second.empty()) {
              waiters_.erase(waiters);
            }
          }
        }
        entry.missing.clear();
        ready_.emplace(entry.round, entry.author, key);
      }
    }
    for (auto &key : stale) {
      dropSuspended(key, "round garbage collected");
    }

    SL_DEBUG(logger_,
             "Collected garbage up to round {}: {} certificates pruned, acked "
             "round {}",
             gc_round,
             pruned,
             acked_round);
  }

  void Core::flushOutbox() {
    size_t sent = 0;
    while (sent < pending_fetches_.size()) {
      auto status = synchronizer_.trySend(pending_fetches_[sent]);
      if (status == SendStatus::Full) {
        break;
      }
      ++sent;
    }
    pending_fetches_.erase(pending_fetches_.begin(),
                           pending_fetches_.begin()
                               + static_cast<ptrdiff_t>(sent));

    if (pending_parents_.has_value()
        and proposer_.trySend(pending_parents_.value()) != SendStatus::Full) {
      pending_parents_.reset();
    }

    // a closed feed is reported by the feed itself
    feed_->flush();
  }

  void Core::redeliver() {
    if (redelivery_.empty()) {
      return;
    }
    auto certificates = std::move(redelivery_);
    redelivery_.clear();
    for (auto &certificate : certificates) {
      if (not feed_->push(certificate)) {
        SL_WARN(logger_,
                "Consensus feed is closed, {} certificates are not delivered",
                certificates.size());
        return;
      }
    }
    SL_DEBUG(logger_,
             "Queued {} stored certificates for delivery again",
             certificates.size());
  }

  void Core::publishSnapshot() {
    snapshot_.exclusiveAccess([&](CoreSnapshot &snapshot) {
      snapshot.round = round_;
      snapshot.gc_round = gc_round_;
      snapshot.dag_size = dag_.size();
      snapshot.suspended = suspended_.size();
      snapshot.frontier.clear();
      for (auto &authority : committee_->authorities()) {
        if (auto frontier = dag_.frontier(authority.id)) {
          snapshot.frontier.emplace(authority.id, frontier.value());
        }
      }
    });
  }

  CoreSnapshot Core::snapshot() const {
    return snapshot_.sharedAccess(
        [](const CoreSnapshot &snapshot) { return snapshot; });
  }

  void Core::fatal(std::string_view what, std::error_code error) {
    SL_CRITICAL(logger_, "{}: {}", what, error.message());
    failed_ = true;
    loop_.requestStop();
    if (on_fatal_) {
      on_fatal_(what, error);
    }
  }

}  // namespace weave::primary
