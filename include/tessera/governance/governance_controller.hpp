#pragma once

#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/custody/claim_ledger.hpp>
#include <tessera/governance/timelock.hpp>
#include <tessera/schema/proposal_status.hpp>
#include <tessera/schema/world_state.hpp>
#include <optional>
#include <string>

namespace tessera::governance {

/// Claim-weighted proposals over parameter changes and auction cancellation.
///
/// Proposals snapshot the claim supply at creation. Votes are weighted by
/// the voter's live claim balance and accepted once per address. A proposal
/// that passes quorum and majority is handed to the timelock, never applied
/// directly.
class governance_controller final {
 public:
  governance_controller(tessera::schema::governance_state_t& state,
                        tessera::custody::claim_ledger& claims,
                        timelock& delay_queue,
                        tessera::common::event_journal& journal);

  tessera::common::status_t create_proposal(
      const tessera::schema::address_t& caller,
      std::string description,
      const tessera::schema::governance_call_t& call,
      tessera::schema::timestamp_milliseconds_t now);

  tessera::common::status_t vote(tessera::schema::proposal_id_t proposal_id,
                                 bool support,
                                 const tessera::schema::address_t& caller,
                                 tessera::schema::timestamp_milliseconds_t now);

  tessera::common::status_t execute_proposal(
      tessera::schema::proposal_id_t proposal_id,
      tessera::schema::timestamp_milliseconds_t now);

  std::optional<tessera::schema::proposal_status_t> status(
      tessera::schema::proposal_id_t proposal_id,
      tessera::schema::timestamp_milliseconds_t now) const;

  std::optional<tessera::schema::proposal_state_t> proposal(
      tessera::schema::proposal_id_t proposal_id) const;

  tessera::schema::proposal_id_t next_proposal_id() const {
    return state_.next_proposal_id;
  }
  const tessera::schema::governance_parameters_t& parameters() const {
    return state_.parameters;
  }

 private:
  bool passes(const tessera::schema::proposal_state_t& proposal) const;
  bool meets_quorum(const tessera::schema::proposal_state_t& proposal) const;

  tessera::schema::governance_state_t& state_;
  tessera::custody::claim_ledger& claims_;
  timelock& timelock_;
  tessera::common::event_journal& journal_;
};

}  // namespace tessera::governance
