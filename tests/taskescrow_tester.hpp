#pragma once

#include <boost/test/unit_test.hpp>
#include <eosio/testing/tester.hpp>
#include <eosio/chain/abi_serializer.hpp>

#include <fc/variant_object.hpp>

#include "contracts.hpp"

using namespace eosio::chain;
using namespace eosio::testing;
using namespace fc;
using namespace std;

using mvo = fc::mutable_variant_object;

namespace taskescrow_testing {

// mirrors escrow_status in the contract
enum class escrow_status : uint8_t {
   created = 0,
   assigned = 1,
   completed = 2,
   approved = 3,
   disputed = 4,
   resolved = 5,
   refunded = 6
};

const symbol usdc_sym = symbol(4, "USDC");

inline asset usdc(const string& amount) {
   return asset::from_string(amount + " USDC");
}

class taskescrow_tester : public tester {
public:

   const name contract_acct = "taskescrow"_n;
   const name token_acct = "eosio.token"_n;
   const string issue_url = "https://github.com/devasign/app/issues/1";
   const string dispute_reason = "work was not delivered as described";

   taskescrow_tester() {
      produce_blocks(2);

      create_accounts({ token_acct, contract_acct, "admin"_n, "alice"_n, "bob"_n, "carol"_n });
      produce_blocks(2);

      set_code(token_acct, contracts::test_token_wasm());
      set_abi(token_acct, contracts::test_token_abi().data());
      set_code(contract_acct, contracts::taskescrow_wasm());
      set_abi(contract_acct, contracts::taskescrow_abi().data());
      produce_blocks();

      abi_ser = load_abi(contract_acct);
      token_abi_ser = load_abi(token_acct);

      BOOST_REQUIRE_EQUAL(success(), push_token_action(token_acct, "create"_n, mvo()
         ("issuer", token_acct)
         ("maximum_supply", usdc("1000000000.0000"))
      ));
      for (auto acct : { "alice"_n, "bob"_n, "carol"_n }) {
         BOOST_REQUIRE_EQUAL(success(), issue(acct, usdc("10000.0000")));
      }
   }

   abi_serializer load_abi(name account) {
      const auto& accnt = control->db().get<account_object, by_name>(account);
      abi_def abi;
      BOOST_REQUIRE_EQUAL(abi_serializer::to_abi(accnt.abi, abi), true);
      return abi_serializer(abi, abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   //======================== action helpers ========================

   action_result push_action(const account_name& signer, const action_name& name, const variant_object& data) {
      string action_type_name = abi_ser.get_action_type(name);

      action act;
      act.account = contract_acct;
      act.name = name;
      act.data = abi_ser.variant_to_binary(action_type_name, data, abi_serializer::create_yield_function(abi_serializer_max_time));

      auto r = base_tester::push_action(std::move(act), signer.to_uint64_t());
      produce_block();
      return r;
   }

   action_result push_token_action(const account_name& signer, const action_name& name, const variant_object& data) {
      string action_type_name = token_abi_ser.get_action_type(name);

      action act;
      act.account = token_acct;
      act.name = name;
      act.data = token_abi_ser.variant_to_binary(action_type_name, data, abi_serializer::create_yield_function(abi_serializer_max_time));

      auto r = base_tester::push_action(std::move(act), signer.to_uint64_t());
      produce_block();
      return r;
   }

   //pushes a successful action and returns its trace, throws on failure
   transaction_trace_ptr push_traced(name signer, name act, const variant_object& data) {
      auto trace = base_tester::push_action(contract_acct, act, signer, data);
      produce_block();
      return trace;
   }

   action_result issue(name to, asset quantity) {
      return push_token_action(token_acct, "issue"_n, mvo()
         ("to", to)
         ("quantity", quantity)
         ("memo", "")
      );
   }

   action_result transfer(name from, name to, asset quantity, const string& memo = "") {
      return push_token_action(from, "transfer"_n, mvo()
         ("from", from)
         ("to", to)
         ("quantity", quantity)
         ("memo", memo)
      );
   }

   action_result deposit(name from, asset quantity) {
      return transfer(from, contract_acct, quantity, "deposit");
   }

   action_result init(name admin = "admin"_n) {
      return push_action(contract_acct, "init"_n, mvo()
         ("admin", admin)
         ("token_contract", token_acct)
         ("token_symbol", "4,USDC")
      );
   }

   action_result setpaused(name signer, bool paused) {
      return push_action(signer, "setpaused"_n, mvo()("paused", paused));
   }

   action_result withdraw(name owner, asset quantity) {
      return push_action(owner, "withdraw"_n, mvo()
         ("account_owner", owner)
         ("quantity", quantity)
      );
   }

   action_result createescrow(name signer, name task_id, name creator, asset amount, const string& url) {
      return push_action(signer, "createescrow"_n, mvo()
         ("task_id", task_id)
         ("creator", creator)
         ("amount", amount)
         ("issue_url", url)
      );
   }

   action_result createescrow(name task_id, name creator, asset amount) {
      return createescrow(creator, task_id, creator, amount, issue_url);
   }

   action_result assign(name signer, name task_id, name contributor) {
      return push_action(signer, "assign"_n, mvo()
         ("task_id", task_id)
         ("contributor", contributor)
      );
   }

   action_result markcomplete(name signer, name task_id) {
      return push_action(signer, "markcomplete"_n, mvo()("task_id", task_id));
   }

   action_result approvepay(name signer, name task_id) {
      return push_action(signer, "approvepay"_n, mvo()("task_id", task_id));
   }

   action_result initdispute(name signer, name task_id, name initiator, const string& reason) {
      return push_action(signer, "initdispute"_n, mvo()
         ("task_id", task_id)
         ("initiator", initiator)
         ("reason", reason)
      );
   }

   action_result resolvedisp(name signer, name task_id, name outcome,
      const fc::variant& to_contributor = fc::variant(), const fc::variant& to_creator = fc::variant()) {
      return push_action(signer, "resolvedisp"_n, mvo()
         ("task_id", task_id)
         ("outcome", outcome)
         ("to_contributor", to_contributor)
         ("to_creator", to_creator)
      );
   }

   action_result refund(name signer, name task_id) {
      return push_action(signer, "refund"_n, mvo()("task_id", task_id));
   }

   action_result getescrow(name task_id) {
      return push_action("alice"_n, "getescrow"_n, mvo()("task_id", task_id));
   }

   action_result getdispute(name task_id) {
      return push_action("alice"_n, "getdispute"_n, mvo()("task_id", task_id));
   }

   //init, deposit and create an escrow funded by creator
   void setup_escrow(name task_id, name creator, asset amount) {
      BOOST_REQUIRE_EQUAL(success(), deposit(creator, amount));
      BOOST_REQUIRE_EQUAL(success(), createescrow(task_id, creator, amount));
   }

   //create an escrow from alice and assign bob
   void setup_assigned(name task_id, asset amount) {
      setup_escrow(task_id, "alice"_n, amount);
      BOOST_REQUIRE_EQUAL(success(), assign("alice"_n, task_id, "bob"_n));
   }

   //create an escrow from alice, assign bob and mark it complete
   void setup_completed(name task_id, asset amount) {
      setup_assigned(task_id, amount);
      BOOST_REQUIRE_EQUAL(success(), markcomplete("bob"_n, task_id));
   }

   //======================== table readers ========================

   fc::variant get_escrow(name task_id) {
      vector<char> data = get_row_by_account(contract_acct, contract_acct, "escrows"_n, task_id);
      return data.empty() ? fc::variant() : abi_ser.binary_to_variant("escrow", data, abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   fc::variant get_dispute(name task_id) {
      vector<char> data = get_row_by_account(contract_acct, contract_acct, "disputes"_n, task_id);
      return data.empty() ? fc::variant() : abi_ser.binary_to_variant("dispute", data, abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   fc::variant get_config_row() {
      vector<char> data = get_row_by_account(contract_acct, contract_acct, "config"_n, "config"_n);
      return data.empty() ? fc::variant() : abi_ser.binary_to_variant("config", data, abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   fc::variant get_state_row() {
      vector<char> data = get_row_by_account(contract_acct, contract_acct, "state"_n, "state"_n);
      return data.empty() ? fc::variant() : abi_ser.binary_to_variant("state", data, abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   uint64_t get_status(name task_id) {
      return get_escrow(task_id)["status"].as_uint64();
   }

   asset get_deposit(name owner) {
      vector<char> data = get_row_by_account(contract_acct, owner, "accounts"_n, name(usdc_sym.to_symbol_code().value));
      return data.empty() ? asset(0, usdc_sym) : abi_ser.binary_to_variant("account", data, abi_serializer::create_yield_function(abi_serializer_max_time))["balance"].as<asset>();
   }

   asset get_token_balance(name owner) {
      return get_currency_balance(token_acct, usdc_sym, owner);
   }

   //funds held by the contract for open escrows
   asset get_escrowed() {
      return get_state_row()["escrowed_funds"].as<asset>();
   }

   //names of the event actions the contract sent to itself in a transaction
   vector<name> get_events(const transaction_trace_ptr& trace) {
      vector<name> events;
      for (const auto& at : trace->action_traces) {
         if (at.receiver == contract_acct && at.act.account == contract_acct && at.act.name.to_string().rfind("log", 0) == 0) {
            events.push_back(at.act.name);
         }
      }
      return events;
   }

   //payload of the first event with the given name in a transaction
   fc::variant get_event(const transaction_trace_ptr& trace, name event) {
      for (const auto& at : trace->action_traces) {
         if (at.receiver == contract_acct && at.act.account == contract_acct && at.act.name == event) {
            return abi_ser.binary_to_variant(event.to_string(), at.act.data, abi_serializer::create_yield_function(abi_serializer_max_time));
         }
      }
      return fc::variant();
   }

   static uint64_t status(escrow_status s) {
      return static_cast<uint64_t>(s);
   }

   abi_serializer abi_ser;
   abi_serializer token_abi_ser;
};

class initialized_tester : public taskescrow_tester {
public:
   initialized_tester() {
      BOOST_REQUIRE_EQUAL(success(), init());
   }
};

} //ns taskescrow_testing
