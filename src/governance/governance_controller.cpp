#include <tessera/governance/governance_controller.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace tessera::schema;
using tessera::common::fail;
using tessera::common::status_t;

namespace {

status_t missing(const proposal_id_t proposal_id) {
  return fail(transaction_error_code::proposal_missing,
              fmt::format("no proposal {}", proposal_id));
}

}  // namespace

namespace tessera::governance {

governance_controller::governance_controller(
    governance_state_t& state,
    tessera::custody::claim_ledger& claims,
    timelock& delay_queue,
    tessera::common::event_journal& journal)
    : state_{state},
      claims_{claims},
      timelock_{delay_queue},
      journal_{journal} {}

status_t governance_controller::create_proposal(
    const address_t& caller,
    std::string description,
    const governance_call_t& call,
    const timestamp_milliseconds_t now) {
  if (call.target != owning_target(call.action)) {
    return fail(transaction_error_code::invalid_governance_call,
                fmt::format("{} is not an action on {}",
                            action_name(call.action), to_string(call.target)));
  }
  const auto supply = claims_.total_supply();
  const auto balance = claims_.balance_of(caller);
  const auto threshold = state_.parameters.proposal_threshold_percentage;
  if (supply == 0 || balance * 100 < supply * threshold) {
    return fail(transaction_error_code::proposal_threshold_not_met,
                fmt::format("proposer holds {} of {} claims; {}% required",
                            to_string(balance), to_string(supply), threshold));
  }

  const auto proposal_id = state_.next_proposal_id++;
  const auto voting_end = now + state_.parameters.voting_period;
  state_.proposals[proposal_id] =
      proposal_state_t{.proposal_id = proposal_id,
                       .proposer = caller,
                       .description = std::move(description),
                       .call = call,
                       .voting_start = now,
                       .voting_end = voting_end,
                       .executed = false,
                       .votes_for = 0,
                       .votes_against = 0,
                       .total_votes = 0,
                       .supply_snapshot = supply,
                       .voters = {},
                       .scheduled_call_id = std::nullopt};

  journal_.emit("proposal_created",
                {{"proposal_id", std::to_string(proposal_id)},
                 {"proposer", to_hex(caller)},
                 {"target", std::string{to_string(call.target)}},
                 {"action", std::string{action_name(call.action)}},
                 {"voting_end", std::to_string(voting_end)}});
  return std::nullopt;
}

status_t governance_controller::vote(const proposal_id_t proposal_id,
                                     const bool support,
                                     const address_t& caller,
                                     const timestamp_milliseconds_t now) {
  auto entry = state_.proposals.find(proposal_id);
  if (entry == std::end(state_.proposals)) {
    return missing(proposal_id);
  }
  auto& proposal = entry->second;
  if (now < proposal.voting_start || now > proposal.voting_end) {
    return fail(transaction_error_code::voting_closed,
                fmt::format("proposal {} accepts votes in [{}, {}]",
                            proposal_id, proposal.voting_start,
                            proposal.voting_end));
  }
  if (std::ranges::find(proposal.voters, caller) !=
      std::end(proposal.voters)) {
    return fail(transaction_error_code::already_voted,
                fmt::format("{} already voted on proposal {}", to_hex(caller),
                            proposal_id));
  }
  const auto weight = claims_.balance_of(caller);
  if (weight == 0) {
    return fail(transaction_error_code::no_voting_power,
                "voter holds no claims");
  }

  if (support) {
    proposal.votes_for += weight;
  } else {
    proposal.votes_against += weight;
  }
  proposal.total_votes += weight;
  proposal.voters.push_back(caller);

  journal_.emit("vote_cast", {{"proposal_id", std::to_string(proposal_id)},
                              {"voter", to_hex(caller)},
                              {"support", support ? "true" : "false"},
                              {"weight", to_string(weight)}});
  return std::nullopt;
}

status_t governance_controller::execute_proposal(
    const proposal_id_t proposal_id,
    const timestamp_milliseconds_t now) {
  auto entry = state_.proposals.find(proposal_id);
  if (entry == std::end(state_.proposals)) {
    return missing(proposal_id);
  }
  auto& proposal = entry->second;
  if (now <= proposal.voting_end) {
    return fail(transaction_error_code::voting_not_ended,
                fmt::format("voting on proposal {} ends at {}", proposal_id,
                            proposal.voting_end));
  }
  if (proposal.executed) {
    return fail(transaction_error_code::proposal_already_executed,
                fmt::format("proposal {} was already executed", proposal_id));
  }
  if (!meets_quorum(proposal)) {
    return fail(transaction_error_code::quorum_not_met,
                fmt::format("{} votes cast; quorum is {}% of {}",
                            to_string(proposal.total_votes),
                            state_.parameters.quorum_percentage,
                            to_string(proposal.supply_snapshot)));
  }
  if (proposal.votes_for <= proposal.votes_against) {
    return fail(transaction_error_code::proposal_rejected,
                fmt::format("proposal {} did not win a majority", proposal_id));
  }

  proposal.executed = true;
  const auto call_id = timelock_.schedule(proposal_id, proposal.call, now);
  proposal.scheduled_call_id = call_id;

  spdlog::debug("Proposal {} passed; scheduled as call {}", proposal_id,
                call_id);
  journal_.emit("proposal_executed",
                {{"proposal_id", std::to_string(proposal_id)},
                 {"call_id", std::to_string(call_id)}});
  return std::nullopt;
}

std::optional<proposal_status_t> governance_controller::status(
    const proposal_id_t proposal_id,
    const timestamp_milliseconds_t now) const {
  auto entry = state_.proposals.find(proposal_id);
  if (entry == std::end(state_.proposals)) {
    return std::nullopt;
  }
  const auto& proposal = entry->second;
  if (now < proposal.voting_start) {
    return proposal_status_t::pending;
  }
  if (now <= proposal.voting_end) {
    return proposal_status_t::active;
  }
  if (proposal.executed) {
    return proposal_status_t::approved;
  }
  if (passes(proposal)) {
    return proposal_status_t::voting_ended;
  }
  return proposal_status_t::rejected;
}

std::optional<proposal_state_t> governance_controller::proposal(
    const proposal_id_t proposal_id) const {
  auto entry = state_.proposals.find(proposal_id);
  if (entry == std::end(state_.proposals)) {
    return std::nullopt;
  }
  return entry->second;
}

bool governance_controller::passes(const proposal_state_t& proposal) const {
  return meets_quorum(proposal) && proposal.votes_for > proposal.votes_against;
}

bool governance_controller::meets_quorum(
    const proposal_state_t& proposal) const {
  return proposal.total_votes >=
         proposal.supply_snapshot * state_.parameters.quorum_percentage / 100;
}

}  // namespace tessera::governance
