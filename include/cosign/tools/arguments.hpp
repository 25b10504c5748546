#pragma once

#include <boost/program_options.hpp>
#include <cosign/schema/action.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/transaction_event.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// Command line plumbing shared by `cosign` and `cosign_signer`. Malformed
// input is fatal (cosign::common::critical).
namespace cosign::tools {

/// --action, --target, --value, --payload, --new-quorum, --address, --trust
void add_action_options(boost::program_options::options_description& options);

/// Build the action selected by --action from the parsed options.
cosign::schema::action_t make_action(
    const boost::program_options::variables_map& vm);

/// Build the action of `kind` from the parsed options.
cosign::schema::action_t make_action(
    const boost::program_options::variables_map& vm,
    cosign::schema::action_kind kind);

cosign::schema::address_t get_address(
    const boost::program_options::variables_map& vm,
    const std::string& name);
cosign::schema::hash32_t get_hash32(
    const boost::program_options::variables_map& vm,
    const std::string& name);

/// Every --signature value, each the 65-byte `r || s || v` hex form.
std::vector<cosign::schema::signature_t> get_signatures(
    const boost::program_options::variables_map& vm);

std::string to_prefixed_hex(const cosign::schema::bytes_view_t& bytes);

/// One line: `#<sequence> <type> key=value ...`.
void print_event(std::ostream& out,
                 const cosign::schema::transaction_event_t& event);

}  // namespace cosign::tools
