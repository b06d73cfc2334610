/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dag/impl/dag_store_impl.hpp"

#include <algorithm>

#include "dag/dag_store_error.hpp"
#include "dag/impl/storage_util.hpp"
#include "serde/serialization.hpp"

namespace weave::dag {

  using storage::Space;

  DagStoreImpl::DagStoreImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<storage::SpacedStorage> storage)
      : logger_(logsys->getLogger("DagStore", "dag_store")),
        storage_(std::move(storage)) {}

  outcome::result<void> DagStoreImpl::putCertificate(
      const Certificate &certificate) {
    auto header_digest = certificate.header.digest();
    auto digest = certificate.digest();
    OUTCOME_TRY(encoded, encode(certificate));

    auto batch = storage_->createBatch();
    OUTCOME_TRY(batch->put(
        Space::Certificates, digest, qtils::ByteVec{std::move(encoded)}));
    OUTCOME_TRY(batch->put(
        Space::CertificateRounds,
        roundPrefixedKey(certificate.round(), certificate.origin()),
        qtils::ByteVec{digest}));
    OUTCOME_TRY(putHeaderTo(*batch, certificate.header, header_digest));
    OUTCOME_TRY(batch->commit());

    SL_TRACE(logger_,
             "Stored certificate {:0x} of round {}",
             digest,
             certificate.round());
    return outcome::success();
  }

  outcome::result<std::optional<Certificate>> DagStoreImpl::getCertificate(
      const Digest &digest) const {
    auto space = storage_->getSpace(Space::Certificates);
    OUTCOME_TRY(encoded_opt, space->tryGet(digest));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(certificate, decode<Certificate>(encoded_opt.value()));
    return certificate;
  }

  outcome::result<bool> DagStoreImpl::hasCertificate(
      const Digest &digest) const {
    auto space = storage_->getSpace(Space::Certificates);
    return space->contains(digest);
  }

  outcome::result<std::optional<Digest>> DagStoreImpl::certificateDigestAt(
      const AuthorityId &author, Round round) const {
    auto space = storage_->getSpace(Space::CertificateRounds);
    OUTCOME_TRY(value_opt, space->tryGet(roundPrefixedKey(round, author)));
    if (not value_opt.has_value()) {
      return std::nullopt;
    }
    auto value = std::move(value_opt.value()).intoByteVec();
    if (value.size() != Digest::size()) {
      return DagStoreError::DANGLING_INDEX_ENTRY;
    }
    Digest digest;
    std::ranges::copy(value, digest.begin());
    return digest;
  }

  outcome::result<std::vector<Certificate>> DagStoreImpl::certificatesAfter(
      Round round) const {
    std::vector<Certificate> certificates;
    auto index = storage_->getSpace(Space::CertificateRounds);
    auto cursor = index->cursor();
    OUTCOME_TRY(cursor->seek(roundKey(round + 1)));
    while (cursor->isValid()) {
      auto value = cursor->value().value().intoByteVec();
      if (value.size() != Digest::size()) {
        return DagStoreError::MALFORMED_INDEX_KEY;
      }
      Digest digest;
      std::ranges::copy(value, digest.begin());
      OUTCOME_TRY(certificate_opt, getCertificate(digest));
      if (not certificate_opt.has_value()) {
        SL_ERROR(logger_,
                 "Certificate {:0x} is indexed but not stored",
                 digest);
        return DagStoreError::DANGLING_INDEX_ENTRY;
      }
      certificates.emplace_back(std::move(certificate_opt.value()));
      OUTCOME_TRY(cursor->next());
    }
    return certificates;
  }

  outcome::result<std::optional<Header>> DagStoreImpl::getHeader(
      const Digest &digest) const {
    auto space = storage_->getSpace(Space::Headers);
    OUTCOME_TRY(encoded_opt, space->tryGet(digest));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(header, decode<Header>(encoded_opt.value()));
    return header;
  }

  outcome::result<void> DagStoreImpl::putVotedHeader(const Header &header) {
    auto digest = header.digest();
    OUTCOME_TRY(encoded_vote,
                encode(LastVote{
                    .round = header.round,
                    .epoch = header.epoch,
                    .header_digest = digest,
                }));

    auto batch = storage_->createBatch();
    OUTCOME_TRY(putHeaderTo(*batch, header, digest));
    OUTCOME_TRY(batch->put(Space::LastVoted,
                           header.author,
                           qtils::ByteVec{std::move(encoded_vote)}));
    return batch->commit();
  }

  outcome::result<std::optional<LastVote>> DagStoreImpl::lastVoted(
      const AuthorityId &origin) const {
    auto space = storage_->getSpace(Space::LastVoted);
    OUTCOME_TRY(encoded_opt, space->tryGet(origin));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(last_vote, decode<LastVote>(encoded_opt.value()));
    return last_vote;
  }

  outcome::result<std::vector<std::pair<AuthorityId, LastVote>>>
  DagStoreImpl::lastVotes() const {
    std::vector<std::pair<AuthorityId, LastVote>> votes;
    auto cursor = storage_->getSpace(Space::LastVoted)->cursor();
    OUTCOME_TRY(cursor->seekFirst());
    while (cursor->isValid()) {
      auto key = cursor->key().value();
      if (key.size() != AuthorityId::size()) {
        return DagStoreError::MALFORMED_INDEX_KEY;
      }
      AuthorityId origin;
      std::ranges::copy(key, origin.begin());
      OUTCOME_TRY(last_vote, decode<LastVote>(cursor->value().value()));
      votes.emplace_back(origin, last_vote);
      OUTCOME_TRY(cursor->next());
    }
    return votes;
  }

  outcome::result<void> DagStoreImpl::putOwnHeader(
      const Header &header, const std::vector<BatchInfo> &batches) {
    OwnProposal proposal;
    proposal.header = header;
    for (auto &info : batches) {
      proposal.batches.push_back(info);
    }
    OUTCOME_TRY(encoded, encode(proposal));
    auto batch = storage_->createBatch();
    OUTCOME_TRY(batch->put(Space::OwnHeaders,
                           roundKey(header.round),
                           qtils::ByteVec{std::move(encoded)}));
    for (auto &batch_ref : header.payload) {
      OUTCOME_TRY(batch->remove(Space::PendingBatches, batch_ref.digest));
    }
    return batch->commit();
  }

  outcome::result<std::optional<OwnProposal>> DagStoreImpl::lastOwnHeader()
      const {
    auto cursor = storage_->getSpace(Space::OwnHeaders)->cursor();
    OUTCOME_TRY(found, cursor->seekLast());
    if (not found) {
      return std::nullopt;
    }
    OUTCOME_TRY(proposal, decode<OwnProposal>(cursor->value().value()));
    return proposal;
  }

  outcome::result<void> DagStoreImpl::putPendingBatches(
      const std::vector<BatchInfo> &batches) {
    auto batch = storage_->createBatch();
    for (auto &info : batches) {
      OUTCOME_TRY(encoded, encode(info));
      OUTCOME_TRY(batch->put(Space::PendingBatches,
                             info.digest,
                             qtils::ByteVec{std::move(encoded)}));
    }
    return batch->commit();
  }

  outcome::result<std::vector<BatchInfo>> DagStoreImpl::pendingBatches()
      const {
    std::vector<BatchInfo> batches;
    auto cursor = storage_->getSpace(Space::PendingBatches)->cursor();
    OUTCOME_TRY(cursor->seekFirst());
    while (cursor->isValid()) {
      OUTCOME_TRY(info, decode<BatchInfo>(cursor->value().value()));
      batches.emplace_back(info);
      OUTCOME_TRY(cursor->next());
    }
    return batches;
  }

  outcome::result<RoundMarkers> DagStoreImpl::markers() const {
    OUTCOME_TRY(round, readMarker(kRoundMarkerKey));
    OUTCOME_TRY(gc_round, readMarker(kGcRoundMarkerKey));
    OUTCOME_TRY(acked_round, readMarker(kAckedRoundMarkerKey));
    return RoundMarkers{
        .round = round,
        .gc_round = gc_round,
        .acked_round = acked_round,
    };
  }

  outcome::result<void> DagStoreImpl::writeRound(Round round) {
    auto space = storage_->getSpace(Space::Default);
    return space->put(kRoundMarkerKey, encodeMarker(round));
  }

  outcome::result<void> DagStoreImpl::writeAckedRound(Round acked_round) {
    auto space = storage_->getSpace(Space::Default);
    return space->put(kAckedRoundMarkerKey, encodeMarker(acked_round));
  }

  outcome::result<void> DagStoreImpl::collectGarbage(Round gc_round,
                                                     Round acked_round) {
    auto batch = storage_->createBatch();
    OUTCOME_TRY(collectRoundIndex(*batch,
                                  Space::CertificateRounds,
                                  Space::Certificates,
                                  gc_round,
                                  false));
    OUTCOME_TRY(collectRoundIndex(
        *batch, Space::HeaderRounds, Space::Headers, gc_round, true));

    // the newest own header survives: it prevents signing another header
    // for its round after a restart
    auto own = storage_->getSpace(Space::OwnHeaders)->cursor();
    OUTCOME_TRY(own->seekLast());
    if (own->isValid()) {
      auto newest = own->key().value();
      OUTCOME_TRY(own->seekFirst());
      while (own->isValid()) {
        auto key = own->key().value();
        auto split = splitRoundKey(key);
        if (not split.has_value()) {
          return DagStoreError::MALFORMED_INDEX_KEY;
        }
        if (split->first > gc_round or key == newest) {
          break;
        }
        OUTCOME_TRY(batch->remove(Space::OwnHeaders, key));
        OUTCOME_TRY(own->next());
      }
    }

    OUTCOME_TRY(batch->put(
        Space::Default, kGcRoundMarkerKey, encodeMarker(gc_round)));
    OUTCOME_TRY(batch->put(
        Space::Default, kAckedRoundMarkerKey, encodeMarker(acked_round)));
    OUTCOME_TRY(batch->commit());

    SL_DEBUG(logger_,
             "Collected garbage up to round {} (acked round {})",
             gc_round,
             acked_round);
    return outcome::success();
  }

  outcome::result<void> DagStoreImpl::putHeaderTo(
      storage::BufferSpacedBatch &batch,
      const Header &header,
      const Digest &digest) const {
    OUTCOME_TRY(encoded, encode(header));
    OUTCOME_TRY(batch.put(
        Space::Headers, digest, qtils::ByteVec{std::move(encoded)}));
    OUTCOME_TRY(batch.put(Space::HeaderRounds,
                          roundPrefixedKey(header.round, digest),
                          qtils::ByteVec{}));
    return outcome::success();
  }

  outcome::result<Round> DagStoreImpl::readMarker(
      const qtils::ByteVec &key) const {
    auto space = storage_->getSpace(Space::Default);
    OUTCOME_TRY(value_opt, space->tryGet(key));
    if (not value_opt.has_value()) {
      return kGenesisRound;
    }
    auto round = decodeMarker(value_opt.value());
    if (not round.has_value()) {
      return DagStoreError::MALFORMED_MARKER;
    }
    return round.value();
  }

  outcome::result<void> DagStoreImpl::collectRoundIndex(
      storage::BufferSpacedBatch &batch,
      Space index_space,
      Space data_space,
      Round gc_round,
      bool digest_in_key) const {
    auto cursor = storage_->getSpace(index_space)->cursor();
    OUTCOME_TRY(cursor->seekFirst());
    size_t removed = 0;
    while (cursor->isValid()) {
      auto key = cursor->key().value();
      auto split = splitRoundKey(key);
      if (not split.has_value()) {
        return DagStoreError::MALFORMED_INDEX_KEY;
      }
      if (split->first > gc_round) {
        break;
      }
      if (digest_in_key) {
        OUTCOME_TRY(batch.remove(data_space, split->second));
      } else {
        auto digest = cursor->value().value().intoByteVec();
        OUTCOME_TRY(batch.remove(data_space, digest));
      }
      OUTCOME_TRY(batch.remove(index_space, key));
      ++removed;
      OUTCOME_TRY(cursor->next());
    }
    SL_TRACE(logger_, "{} round index entries scheduled for removal", removed);
    return outcome::success();
  }

}  // namespace weave::dag
