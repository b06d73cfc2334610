/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primary/synchronizer.hpp"

#include <algorithm>

#include <qtils/visit_in_place.hpp>

namespace weave::primary {

  namespace {
    std::string_view kindName(FetchKind kind) {
      return kind == FetchKind::Certificates ? "certificate" : "header";
    }
  }  // namespace

  Synchronizer::Synchronizer(qtils::SharedRef<log::LoggingSystem> logsys,
                             SyncParameters params,
                             CommitteePtr committee,
                             qtils::SharedRef<dag::DagStore> store,
                             qtils::SharedRef<network::PeerNetwork> network,
                             qtils::SharedRef<clock::SteadyClock> clock,
                             Channel<SynchronizerMessage>::Receiver inbox,
                             Channel<CoreMessage>::Sender core,
                             FatalHandler on_fatal,
                             uint64_t seed)
      : logger_(logsys->getLogger("Synchronizer", "synchronizer")),
        params_(params),
        committee_(std::move(committee)),
        store_(std::move(store)),
        network_(std::move(network)),
        clock_(std::move(clock)),
        inbox_(std::move(inbox)),
        core_(std::move(core)),
        on_fatal_(std::move(on_fatal)),
        random_(seed) {}

  void Synchronizer::start(std::shared_ptr<Watchdog> watchdog,
                           std::chrono::milliseconds tick_interval) {
    loop_.start("sync", std::move(watchdog), [this, tick_interval] {
      if (auto message = inbox_.receiveFor(tick_interval)) {
        process(std::move(message.value()));
      } else if (inbox_.isFinished()) {
        loop_.requestStop();
        return;
      }
      tick();
    });
  }

  void Synchronizer::stop() {
    inbox_.close();
    loop_.stop();
  }

  void Synchronizer::process(SynchronizerMessage message) {
    if (failed_) {
      return;
    }
    qtils::visit_in_place(
        message,
        [&](FetchRequest &request) { onFetchRequest(std::move(request)); },
        [&](network::Envelope &envelope) { onEnvelope(std::move(envelope)); });
  }

  void Synchronizer::onFetchRequest(FetchRequest request) {
    auto now = clock_->now();
    size_t coalesced = 0;
    for (auto &digest : request.digests) {
      auto [it, inserted] =
          inflight_.try_emplace(Key{request.kind, digest}, Inflight{});
      auto &entry = it->second;
      if (inserted) {
        entry.peers = askOrder(request.preferred, request.hints);
        entry.started = now;
        entry.next_attempt = now;
        continue;
      }
      ++coalesced;
      // newly hinted peers are asked next
      for (auto &hint : request.hints) {
        auto known = std::ranges::find(entry.peers, hint);
        if (known != entry.peers.end() or hint == network_->self()) {
          continue;
        }
        if (entry.peers.empty()) {
          entry.peers.emplace_back(hint);
        } else {
          auto next = entry.cursor % entry.peers.size();
          entry.peers.insert(
              entry.peers.begin() + static_cast<ptrdiff_t>(next), hint);
          entry.cursor = next;
        }
      }
    }
    SL_DEBUG(logger_,
             "Fetch {} {}s ({} already in flight)",
             request.digests.size(),
             kindName(request.kind),
             coalesced);
  }

  void Synchronizer::onEnvelope(network::Envelope envelope) {
    auto &from = envelope.from;
    qtils::visit_in_place(
        envelope.message,
        [&](const network::FetchCertificatesRequest &request) {
          serve(from, request);
        },
        [&](const network::FetchHeadersRequest &request) {
          serve(from, request);
        },
        [&](network::FetchCertificatesResponse &response) {
          std::vector<Certificate> certificates;
          std::vector<Digest> delivered;
          for (auto &certificate : response.certificates) {
            auto digest = certificate.digest();
            if (inflight_.contains(Key{FetchKind::Certificates, digest})) {
              delivered.emplace_back(digest);
              certificates.emplace_back(std::move(certificate));
            }
          }
          onResponse(
              from, response.request_id, FetchKind::Certificates, delivered);
          if (not certificates.empty()) {
            core_.send(FetchedCertificates{
                .from = from,
                .certificates = std::move(certificates),
            });
          }
        },
        [&](network::FetchHeadersResponse &response) {
          std::vector<Header> headers;
          std::vector<Digest> delivered;
          for (auto &header : response.headers) {
            auto digest = header.digest();
            if (inflight_.contains(Key{FetchKind::Headers, digest})) {
              delivered.emplace_back(digest);
              headers.emplace_back(std::move(header));
            }
          }
          onResponse(from, response.request_id, FetchKind::Headers, delivered);
          if (not headers.empty()) {
            core_.send(FetchedHeaders{
                .from = from,
                .headers = std::move(headers),
            });
          }
        },
        [&](const auto &) {
          SL_TRACE(logger_,
                   "Ignore message #{} from {}",
                   envelope.message.index(),
                   committee_->nameOf(from));
        });
  }

  void Synchronizer::serve(const AuthorityId &from,
                           const network::FetchCertificatesRequest &request) {
    network::FetchCertificatesResponse response;
    response.request_id = request.request_id;
    size_t served = 0;
    for (auto &digest : request.digests) {
      if (served++ == params_.max_fetch_batch) {
        break;
      }
      auto certificate = store_->getCertificate(digest);
      if (certificate.has_error()) {
        fatal("Reading certificate", certificate.error());
        return;
      }
      if (certificate.value().has_value()) {
        response.certificates.push_back(std::move(certificate.value().value()));
      } else {
        response.missing.push_back(digest);
      }
    }
    SL_TRACE(logger_,
             "Serve {} certificates to {}, {} not found",
             response.certificates.size(),
             committee_->nameOf(from),
             response.missing.size());
    network_->send(from, std::move(response));
  }

  void Synchronizer::serve(const AuthorityId &from,
                           const network::FetchHeadersRequest &request) {
    network::FetchHeadersResponse response;
    response.request_id = request.request_id;
    size_t served = 0;
    for (auto &digest : request.digests) {
      if (served++ == params_.max_fetch_batch) {
        break;
      }
      auto header = store_->getHeader(digest);
      if (header.has_error()) {
        fatal("Reading header", header.error());
        return;
      }
      if (header.value().has_value()) {
        response.headers.push_back(std::move(header.value().value()));
      } else {
        response.missing.push_back(digest);
      }
    }
    SL_TRACE(logger_,
             "Serve {} headers to {}, {} not found",
             response.headers.size(),
             committee_->nameOf(from),
             response.missing.size());
    network_->send(from, std::move(response));
  }

  void Synchronizer::onResponse(const AuthorityId &from,
                                uint64_t request_id,
                                FetchKind kind,
                                const std::vector<Digest> &delivered) {
    for (auto &digest : delivered) {
      inflight_.erase(Key{kind, digest});
    }
    auto it = requests_.find(request_id);
    if (it == requests_.end() or it->second.peer != from) {
      return;
    }
    // what was asked and not delivered counts as a failed attempt
    for (auto &digest : it->second.digests) {
      auto entry = inflight_.find(Key{kind, digest});
      if (entry != inflight_.end() and entry->second.outstanding != 0) {
        --entry->second.outstanding;
      }
    }
    requests_.erase(it);
  }

  void Synchronizer::tick() {
    if (failed_) {
      return;
    }
    auto now = clock_->now();

    for (auto it = requests_.begin(); it != requests_.end();) {
      if (now < it->second.deadline) {
        ++it;
        continue;
      }
      SL_DEBUG(logger_,
               "Request #{} to {} timed out",
               it->first,
               committee_->nameOf(it->second.peer));
      for (auto &digest : it->second.digests) {
        auto entry = inflight_.find(Key{it->second.kind, digest});
        if (entry != inflight_.end() and entry->second.outstanding != 0) {
          --entry->second.outstanding;
        }
      }
      it = requests_.erase(it);
    }

    std::map<std::pair<AuthorityId, FetchKind>, std::vector<Digest>> batches;
    std::vector<Key> exhausted;
    for (auto &[key, entry] : inflight_) {
      if (entry.outstanding != 0) {
        continue;
      }
      if (entry.attempts >= params_.max_attempts
          or now - entry.started >= params_.deadline) {
        exhausted.emplace_back(key);
        continue;
      }
      if (now < entry.next_attempt or entry.peers.empty()) {
        continue;
      }
      ++entry.attempts;
      entry.next_attempt = now + backoff(entry.attempts);
      auto asked = std::min(params_.retry_nodes, entry.peers.size());
      for (size_t i = 0; i < asked; ++i) {
        auto &peer = entry.peers[entry.cursor++ % entry.peers.size()];
        batches[{peer, key.first}].emplace_back(key.second);
        ++entry.outstanding;
      }
    }

    for (auto &key : exhausted) {
      reportUnavailable(key);
    }

    for (auto &[target, digests] : batches) {
      auto &[peer, kind] = target;
      for (size_t offset = 0; offset < digests.size();
           offset += params_.max_fetch_batch) {
        auto end = std::min(digests.size(), offset + params_.max_fetch_batch);
        send(peer,
             kind,
             {digests.begin() + static_cast<ptrdiff_t>(offset),
              digests.begin() + static_cast<ptrdiff_t>(end)},
             now);
      }
    }
  }

  std::vector<AuthorityId> Synchronizer::askOrder(
      const std::optional<AuthorityId> &preferred,
      const std::vector<AuthorityId> &hints) {
    std::vector<AuthorityId> peers;
    auto add = [&](const AuthorityId &peer) {
      if (peer != network_->self() and committee_->contains(peer)
          and std::ranges::find(peers, peer) == peers.end()) {
        peers.emplace_back(peer);
      }
    };
    if (preferred.has_value()) {
      add(preferred.value());
    }
    for (auto &hint : hints) {
      add(hint);
    }
    auto &authorities = committee_->authorities();
    auto offset = rotation_++;
    for (size_t i = 0; i < authorities.size(); ++i) {
      add(authorities[(offset + i) % authorities.size()].id);
    }
    return peers;
  }

  std::chrono::milliseconds Synchronizer::backoff(uint32_t attempts) {
    auto delay = params_.retry_base_delay;
    for (uint32_t i = 1; i < attempts and delay < params_.retry_max_delay;
         ++i) {
      delay *= 2;
    }
    delay = std::min(delay, params_.retry_max_delay);
    auto jitter = std::uniform_int_distribution<int64_t>{
        0, delay.count() / 2}(random_);
    return delay + std::chrono::milliseconds{jitter};
  }

  void Synchronizer::reportUnavailable(const Key &key) {
    auto &[kind, digest] = key;
    auto &entry = inflight_.at(key);
    SL_WARN(logger_,
            "{} {:0x} is unavailable after {} attempts",
            kindName(kind),
            digest,
            entry.attempts);
    inflight_.erase(key);
    core_.send(FetchUnavailable{.kind = kind, .digest = digest});
  }

  void Synchronizer::send(const AuthorityId &peer,
                          FetchKind kind,
                          std::vector<Digest> digests,
                          TimePoint now) {
    auto request_id = next_request_id_++;
    network::FetchDigests list;
    for (auto &digest : digests) {
      list.push_back(digest);
    }
    SL_TRACE(logger_,
             "Request #{}: {} {}s from {}",
             request_id,
             digests.size(),
             kindName(kind),
             committee_->nameOf(peer));
    requests_.emplace(request_id,
                      Request{
                          .peer = peer,
                          .kind = kind,
                          .digests = std::move(digests),
                          .deadline = now + params_.request_timeout,
                      });
    if (kind == FetchKind::Certificates) {
      network_->send(peer,
                     network::FetchCertificatesRequest{
                         .request_id = request_id,
                         .digests = std::move(list),
                     });
    } else {
      network_->send(peer,
                     network::FetchHeadersRequest{
                         .request_id = request_id,
                         .digests = std::move(list),
                     });
    }
  }

  void Synchronizer::fatal(std::string_view what, std::error_code error) {
    SL_CRITICAL(logger_, "{}: {}", what, error.message());
    failed_ = true;
    loop_.requestStop();
    if (on_fatal_) {
      on_fatal_(what, error);
    }
  }

}  // namespace weave::primary
