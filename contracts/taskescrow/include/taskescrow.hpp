// Task Escrow holds bounty funds in custody between a task creator and a contributor.
//
// @contract taskescrow
// @version v1.0.0

#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/asset.hpp>
#include <eosio/action.hpp>

using namespace std;
using namespace eosio;

//escrow statuses: created, assigned, completed, approved, disputed, resolved, refunded
//terminal statuses: approved, resolved, refunded
//dispute outcomes: refund, fullpayment, split

enum class escrow_status : uint8_t {
    created = 0,
    assigned = 1,
    completed = 2,
    approved = 3,
    disputed = 4,
    resolved = 5,
    refunded = 6
};

inline bool operator==(const uint8_t& a, const escrow_status& b) {
    return a == static_cast<uint8_t>(b);
}

inline bool operator!=(const uint8_t& a, const escrow_status& b) {
    return a != static_cast<uint8_t>(b);
}

CONTRACT taskescrow : public contract
{
    public:

    taskescrow(name self, name code, datastream<const char*> ds) : contract(self, code, ds) {}
    ~taskescrow() {}

    static constexpr size_t MAX_URL_LEN = 500;
    static constexpr size_t MIN_REASON_LEN = 10;
    static constexpr size_t MAX_REASON_LEN = 500;

    //======================== config actions ========================

    //initialize the contract
    //pre: config singleton not initialized, admin and token_contract accounts exist
    //auth: self
    ACTION init(name admin, name token_contract, symbol token_symbol);

    //pause or unpause the escrow lifecycle actions
    //auth: admin_acct
    ACTION setpaused(bool paused);

    //======================== escrow actions ========================

    //create a new escrow, moving amount from the creator's deposit into custody
    //pre: task_id unused, amount > 0, creator deposit >= amount
    //post: escrow.status == created
    //auth: creator
    ACTION createescrow(name task_id, name creator, asset amount, string issue_url);

    //assign a contributor to an escrow
    //pre: escrow.status == created
    //post: escrow.status == assigned
    //auth: creator
    ACTION assign(name task_id, name contributor);

    //report the task as done
    //pre: escrow.status == assigned
    //post: escrow.status == completed
    //auth: contributor
    ACTION markcomplete(name task_id);

    //approve completed work and pay the contributor
    //pre: escrow.status == completed
    //post: escrow.status == approved
    //auth: creator
    ACTION approvepay(name task_id);

    //open a dispute on an escrow
    //pre: escrow.status == assigned || completed
    //post: escrow.status == disputed
    //auth: initiator (creator or contributor)
    ACTION initdispute(name task_id, name initiator, string reason);

    //settle a dispute: full refund, full payment, or a split summing to the escrowed amount
    //pre: escrow.status == disputed
    //post: escrow.status == resolved
    //auth: admin_acct
    ACTION resolvedisp(name task_id, name outcome, optional<asset> to_contributor, optional<asset> to_creator);

    //return escrowed funds to the creator before any contributor is assigned
    //pre: escrow.status == created
    //post: escrow.status == refunded
    //auth: creator
    ACTION refund(name task_id);

    //======================== account actions ========================

    //withdraw unused deposit
    //pre: account.balance >= quantity
    //auth: account_owner
    ACTION withdraw(name account_owner, asset quantity);

    //======================== event actions ========================

    //inline notifications sent by the contract to itself after each committed transition
    //auth: self

    ACTION logcreated(name task_id, name creator, asset amount);
    ACTION logassigned(name task_id, name contributor);
    ACTION logcompleted(name task_id, name contributor);
    ACTION logreleased(name task_id, name to, asset amount);
    ACTION logdisputed(name task_id, name initiator, string reason);
    ACTION logresolved(name task_id, name outcome, asset to_contributor, asset to_creator, name resolved_by);
    ACTION logrefunded(name task_id, name to, asset amount);

    using logcreated_action = action_wrapper<"logcreated"_n, &taskescrow::logcreated>;
    using logassigned_action = action_wrapper<"logassigned"_n, &taskescrow::logassigned>;
    using logcompleted_action = action_wrapper<"logcompleted"_n, &taskescrow::logcompleted>;
    using logreleased_action = action_wrapper<"logreleased"_n, &taskescrow::logreleased>;
    using logdisputed_action = action_wrapper<"logdisputed"_n, &taskescrow::logdisputed>;
    using logresolved_action = action_wrapper<"logresolved"_n, &taskescrow::logresolved>;
    using logrefunded_action = action_wrapper<"logrefunded"_n, &taskescrow::logrefunded>;

    //======================== notification handlers ========================

    //catches transfer notifications from the configured token contract
    [[eosio::on_notify("*::transfer")]]
    void catch_transfer(name from, name to, asset quantity, string memo);

    //======================== contract tables ========================

    //config table
    //scope: self
    TABLE config {
        string contract_version; //semver compliant contract version
        name admin_acct; //account that resolves disputes and pauses the contract
        name token_contract; //account of the token contract holding custody balances
        symbol token_symbol; //symbol of the escrowed token

        EOSLIB_SERIALIZE(config, (contract_version)(admin_acct)(token_contract)(token_symbol))
    };
    typedef singleton<name("config"), config> config_singleton;

    //state table
    //scope: self
    TABLE state {
        bool paused = false; //lifecycle actions rejected while true
        uint64_t task_count = 0; //total escrows created
        asset escrowed_funds; //funds held for open escrows
        asset deposited_funds; //funds deposited but not yet escrowed
        asset paid_funds; //total lifetime funds paid to contributors
        asset refunded_funds; //total lifetime funds returned to creators

        EOSLIB_SERIALIZE(state, (paused)(task_count)(escrowed_funds)(deposited_funds)
            (paid_funds)(refunded_funds))
    };
    typedef singleton<name("state"), state> state_singleton;

    //escrows table
    //scope: self
    TABLE escrow {
        name task_id; //unique id of the task
        name creator; //sponsor funding the bounty
        name contributor = name(0); //assigned beneficiary (blank until assigned)
        asset amount; //escrowed bounty
        uint8_t status = static_cast<uint8_t>(escrow_status::created);
        string issue_url; //link to the task description
        time_point_sec created_at;
        time_point_sec updated_at;
        time_point_sec completed_at = time_point_sec(0); //set by markcomplete

        uint64_t primary_key() const { return task_id.value; }
        uint64_t by_creator() const { return creator.value; }
        uint64_t by_contributor() const { return contributor.value; }
        uint64_t by_status() const { return static_cast<uint64_t>(status); }
        EOSLIB_SERIALIZE(escrow, (task_id)(creator)(contributor)(amount)(status)
            (issue_url)(created_at)(updated_at)(completed_at))
    };
    typedef multi_index<name("escrows"), escrow,
        indexed_by<name("bycreator"), const_mem_fun<escrow, uint64_t, &escrow::by_creator>>,
        indexed_by<name("bycontrib"), const_mem_fun<escrow, uint64_t, &escrow::by_contributor>>,
        indexed_by<name("bystatus"), const_mem_fun<escrow, uint64_t, &escrow::by_status>>
    > escrows_table;

    //disputes table
    //scope: self
    TABLE dispute {
        name task_id; //disputed task
        name initiator; //creator or contributor who opened the dispute
        string reason;
        time_point_sec initiated_at;
        name outcome = name(0); //refund, fullpayment, split (blank until resolved)
        asset to_contributor; //disbursed to contributor on resolution
        asset to_creator; //disbursed to creator on resolution
        name resolved_by = name(0);
        time_point_sec resolved_at = time_point_sec(0);

        uint64_t primary_key() const { return task_id.value; }
        EOSLIB_SERIALIZE(dispute, (task_id)(initiator)(reason)(initiated_at)
            (outcome)(to_contributor)(to_creator)(resolved_by)(resolved_at))
    };
    typedef multi_index<name("disputes"), dispute> disputes_table;

    //accounts table
    //scope: account_name.value
    TABLE account {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }
        EOSLIB_SERIALIZE(account, (balance))
    };
    typedef multi_index<name("accounts"), account> accounts_table;

    //======================== read-only actions ========================

    //return an escrow record
    [[eosio::action]] escrow getescrow(name task_id);

    //return the dispute record of an escrow
    [[eosio::action]] dispute getdispute(name task_id);

    private:

    //======================== functions ========================

    //returns config, fails if contract not initialized
    config get_config();

    //fails if lifecycle actions are paused
    void check_not_paused();

    //authorization guard
    void require_admin(const config& conf);
    void require_creator(const escrow& esc);
    void require_contributor(const escrow& esc);
    void require_party(const escrow& esc, name account);

    //moves quantity from a deposit into escrow custody
    void pull_funds(const config& conf, name from, asset quantity);

    //moves quantity out of escrow custody to an account through the token contract
    void push_funds(const config& conf, name to, asset quantity, string memo);

    //sends an inline transfer from self on the token contract
    void send_transfer(const config& conf, name to, asset quantity, string memo);

    //subtracts amount from deposit balance
    void sub_balance(name account_owner, asset quantity);

    //adds amount to deposit balance
    void add_balance(name account_owner, asset quantity);

    //returns true if outcome is refund, fullpayment or split
    bool valid_outcome(name outcome);

};
