#include "../include/taskescrow.hpp"

//======================== config actions ========================

ACTION taskescrow::init(name admin, name token_contract, symbol token_symbol)
{
    //authenticate
    require_auth(get_self());

    //open config singleton
    config_singleton configs(get_self(), get_self().value);

    //validate
    check(!configs.exists(), "ERR::ALREADY_INITIALIZED::contract already initialized");
    check(is_account(admin), "ERR::INVALID_ACCOUNT::admin account doesn't exist");
    check(is_account(token_contract), "ERR::INVALID_ACCOUNT::token contract account doesn't exist");
    check(token_symbol.is_valid(), "ERR::INVALID_AMOUNT::invalid token symbol");

    //initialize
    config initial_conf;
    initial_conf.contract_version = "1.0.0";
    initial_conf.admin_acct = admin;
    initial_conf.token_contract = token_contract;
    initial_conf.token_symbol = token_symbol;

    state initial_state;
    initial_state.escrowed_funds = asset(0, token_symbol);
    initial_state.deposited_funds = asset(0, token_symbol);
    initial_state.paid_funds = asset(0, token_symbol);
    initial_state.refunded_funds = asset(0, token_symbol);

    //set initial config and state
    configs.set(initial_conf, get_self());
    state_singleton states(get_self(), get_self().value);
    states.set(initial_state, get_self());
}

ACTION taskescrow::setpaused(bool paused)
{
    //get config
    auto conf = get_config();

    //authenticate
    require_admin(conf);

    //open state singleton, get state
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();

    //set new state
    st.paused = paused;
    states.set(st, get_self());
}

//======================== escrow actions ========================

ACTION taskescrow::createescrow(name task_id, name creator, asset amount, string issue_url)
{
    //get config
    auto conf = get_config();
    check_not_paused();

    //authenticate
    check(has_auth(creator), "ERR::UNAUTHORIZED::requires creator to authenticate");

    //validate
    check(task_id.value != 0, "ERR::INVALID_TASK_ID::task id cannot be empty");
    check(amount.symbol == conf.token_symbol, "ERR::INVALID_AMOUNT::amount must be in " + conf.token_symbol.code().to_string());
    check(amount.is_valid(), "ERR::INVALID_AMOUNT::invalid amount");
    check(amount.amount > 0, "ERR::INVALID_AMOUNT::amount must be positive");
    check(!issue_url.empty(), "ERR::INVALID_ISSUE_URL::issue url cannot be empty");
    check(issue_url.length() <= MAX_URL_LEN, "ERR::INVALID_ISSUE_URL::issue url is too long");

    //open escrows table, find escrow
    escrows_table escrows(get_self(), get_self().value);
    check(escrows.find(task_id.value) == escrows.end(), "ERR::TASK_ALREADY_EXISTS::escrow already exists for task");

    //move amount from creator deposit into custody
    pull_funds(conf, creator, amount);

    //create new escrow
    //ram payer: creator
    time_point_sec now = time_point_sec(current_time_point());
    escrows.emplace(creator, [&](auto& col) {
        col.task_id = task_id;
        col.creator = creator;
        col.amount = amount;
        col.issue_url = issue_url;
        col.created_at = now;
        col.updated_at = now;
    });

    //update task count
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.task_count += 1;
    states.set(st, get_self());

    logcreated_action logcreated(get_self(), {get_self(), name("active")});
    logcreated.send(task_id, creator, amount);
}

ACTION taskescrow::assign(name task_id, name contributor)
{
    //validate initialized
    get_config();
    check_not_paused();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    auto& esc = escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");

    //authenticate
    require_creator(esc);

    //validate
    check(esc.status == escrow_status::created, "ERR::INVALID_STATE_TRANSITION::escrow must be in created state to assign a contributor");
    check(is_account(contributor), "ERR::INVALID_ACCOUNT::contributor account doesn't exist");

    //update escrow
    escrows.modify(esc, same_payer, [&](auto& col) {
        col.contributor = contributor;
        col.status = static_cast<uint8_t>(escrow_status::assigned);
        col.updated_at = time_point_sec(current_time_point());
    });

    logassigned_action logassigned(get_self(), {get_self(), name("active")});
    logassigned.send(task_id, contributor);
}

ACTION taskescrow::markcomplete(name task_id)
{
    //validate initialized
    get_config();
    check_not_paused();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    auto& esc = escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");

    //authenticate
    require_contributor(esc);

    //validate
    check(esc.status == escrow_status::assigned, "ERR::INVALID_STATE_TRANSITION::escrow must be in assigned state to mark complete");

    //update escrow
    time_point_sec now = time_point_sec(current_time_point());
    escrows.modify(esc, same_payer, [&](auto& col) {
        col.status = static_cast<uint8_t>(escrow_status::completed);
        col.completed_at = now;
        col.updated_at = now;
    });

    logcompleted_action logcompleted(get_self(), {get_self(), name("active")});
    logcompleted.send(task_id, esc.contributor);
}

ACTION taskescrow::approvepay(name task_id)
{
    //get config
    auto conf = get_config();
    check_not_paused();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    auto& esc = escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");

    //authenticate
    require_creator(esc);

    //validate
    check(esc.status == escrow_status::completed, "ERR::INVALID_STATE_TRANSITION::escrow must be in completed state to approve");

    //pay contributor
    push_funds(conf, esc.contributor, esc.amount, "Task Escrow payment: " + task_id.to_string());

    //update escrow
    escrows.modify(esc, same_payer, [&](auto& col) {
        col.status = static_cast<uint8_t>(escrow_status::approved);
        col.updated_at = time_point_sec(current_time_point());
    });

    //update lifetime totals
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.paid_funds += esc.amount;
    states.set(st, get_self());

    logreleased_action logreleased(get_self(), {get_self(), name("active")});
    logreleased.send(task_id, esc.contributor, esc.amount);
}

ACTION taskescrow::initdispute(name task_id, name initiator, string reason)
{
    //validate initialized
    get_config();
    check_not_paused();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    auto& esc = escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");

    //authenticate
    require_party(esc, initiator);

    //validate
    check(esc.status == escrow_status::assigned || esc.status == escrow_status::completed,
        "ERR::INVALID_STATE_TRANSITION::escrow must be in assigned or completed state to dispute");
    check(reason.length() >= MIN_REASON_LEN, "ERR::INVALID_DISPUTE_REASON::dispute reason is too short");
    check(reason.length() <= MAX_REASON_LEN, "ERR::INVALID_DISPUTE_REASON::dispute reason is too long");

    //record dispute
    //ram payer: self
    time_point_sec now = time_point_sec(current_time_point());
    disputes_table disputes(get_self(), get_self().value);
    disputes.emplace(get_self(), [&](auto& col) {
        col.task_id = task_id;
        col.initiator = initiator;
        col.reason = reason;
        col.initiated_at = now;
        col.to_contributor = asset(0, esc.amount.symbol);
        col.to_creator = asset(0, esc.amount.symbol);
    });

    //update escrow
    escrows.modify(esc, same_payer, [&](auto& col) {
        col.status = static_cast<uint8_t>(escrow_status::disputed);
        col.updated_at = now;
    });

    logdisputed_action logdisputed(get_self(), {get_self(), name("active")});
    logdisputed.send(task_id, initiator, reason);
}

ACTION taskescrow::resolvedisp(name task_id, name outcome, optional<asset> to_contributor, optional<asset> to_creator)
{
    //get config
    auto conf = get_config();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    auto& esc = escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");

    //authenticate
    require_admin(conf);

    //validate
    check(esc.status == escrow_status::disputed, "ERR::INVALID_STATE_TRANSITION::escrow must be in disputed state to resolve");
    check(valid_outcome(outcome), "ERR::INVALID_OUTCOME::outcome must be refund, fullpayment or split");

    //initialize
    asset contributor_share = asset(0, esc.amount.symbol);
    asset creator_share = asset(0, esc.amount.symbol);

    if (outcome == name("split")) {
        check(to_contributor.has_value() && to_creator.has_value(), "ERR::INVALID_AMOUNT::split outcome requires both amounts");
        check(to_contributor->symbol == esc.amount.symbol && to_creator->symbol == esc.amount.symbol,
            "ERR::INVALID_AMOUNT::split amounts must be in " + esc.amount.symbol.code().to_string());
        check(to_contributor->amount > 0 && to_creator->amount > 0, "ERR::INVALID_AMOUNT::split amounts must be positive");
        check(*to_contributor + *to_creator == esc.amount, "ERR::INVALID_AMOUNT::split amounts must sum to escrowed amount");

        contributor_share = *to_contributor;
        creator_share = *to_creator;
    } else {
        check(!to_contributor.has_value() && !to_creator.has_value(), "ERR::INVALID_AMOUNT::split amounts are only accepted with the split outcome");

        if (outcome == name("fullpayment")) {
            contributor_share = esc.amount;
        } else {
            creator_share = esc.amount;
        }
    }

    //disburse
    string memo = "Task Escrow dispute resolution: " + task_id.to_string();
    if (contributor_share.amount > 0) {
        push_funds(conf, esc.contributor, contributor_share, memo);
    }
    if (creator_share.amount > 0) {
        push_funds(conf, esc.creator, creator_share, memo);
    }

    //update dispute
    time_point_sec now = time_point_sec(current_time_point());
    disputes_table disputes(get_self(), get_self().value);
    auto& disp = disputes.get(task_id.value, "ERR::TASK_NOT_DISPUTED::dispute record not found");
    disputes.modify(disp, same_payer, [&](auto& col) {
        col.outcome = outcome;
        col.to_contributor = contributor_share;
        col.to_creator = creator_share;
        col.resolved_by = conf.admin_acct;
        col.resolved_at = now;
    });

    //update escrow
    escrows.modify(esc, same_payer, [&](auto& col) {
        col.status = static_cast<uint8_t>(escrow_status::resolved);
        col.updated_at = now;
    });

    //update lifetime totals
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.paid_funds += contributor_share;
    st.refunded_funds += creator_share;
    states.set(st, get_self());

    logresolved_action logresolved(get_self(), {get_self(), name("active")});
    logresolved.send(task_id, outcome, contributor_share, creator_share, conf.admin_acct);
}

ACTION taskescrow::refund(name task_id)
{
    //get config
    auto conf = get_config();
    check_not_paused();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    auto& esc = escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");

    //authenticate
    require_creator(esc);

    //validate
    check(esc.status == escrow_status::created, "ERR::INVALID_STATE_TRANSITION::escrow can only be refunded before a contributor is assigned");

    //return funds to creator
    push_funds(conf, esc.creator, esc.amount, "Task Escrow refund: " + task_id.to_string());

    //update escrow
    escrows.modify(esc, same_payer, [&](auto& col) {
        col.status = static_cast<uint8_t>(escrow_status::refunded);
        col.updated_at = time_point_sec(current_time_point());
    });

    //update lifetime totals
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.refunded_funds += esc.amount;
    states.set(st, get_self());

    logrefunded_action logrefunded(get_self(), {get_self(), name("active")});
    logrefunded.send(task_id, esc.creator, esc.amount);
}

//======================== account actions ========================

ACTION taskescrow::withdraw(name account_owner, asset quantity)
{
    //get config
    auto conf = get_config();

    //authenticate
    require_auth(account_owner);

    //validate
    check(quantity.symbol == conf.token_symbol, "ERR::INVALID_AMOUNT::must withdraw " + conf.token_symbol.code().to_string());
    check(quantity.amount > 0, "ERR::INVALID_AMOUNT::must withdraw positive amount");

    //subtract balance from account
    sub_balance(account_owner, quantity);

    //update state
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.deposited_funds -= quantity;
    states.set(st, get_self());

    print("withdraw: ", account_owner, " ", quantity);

    //inline transfer
    send_transfer(conf, account_owner, quantity, "Task Escrow withdrawal");
}

//======================== event actions ========================

ACTION taskescrow::logcreated(name task_id, name creator, asset amount)
{
    require_auth(get_self());
}

ACTION taskescrow::logassigned(name task_id, name contributor)
{
    require_auth(get_self());
}

ACTION taskescrow::logcompleted(name task_id, name contributor)
{
    require_auth(get_self());
}

ACTION taskescrow::logreleased(name task_id, name to, asset amount)
{
    require_auth(get_self());
}

ACTION taskescrow::logdisputed(name task_id, name initiator, string reason)
{
    require_auth(get_self());
}

ACTION taskescrow::logresolved(name task_id, name outcome, asset to_contributor, asset to_creator, name resolved_by)
{
    require_auth(get_self());
}

ACTION taskescrow::logrefunded(name task_id, name to, asset amount)
{
    require_auth(get_self());
}

//======================== read-only actions ========================

taskescrow::escrow taskescrow::getescrow(name task_id)
{
    get_config();

    //open escrows table, get escrow
    escrows_table escrows(get_self(), get_self().value);
    return escrows.get(task_id.value, "ERR::TASK_NOT_FOUND::escrow not found");
}

taskescrow::dispute taskescrow::getdispute(name task_id)
{
    get_config();

    //validate
    escrows_table escrows(get_self(), get_self().value);
    check(escrows.find(task_id.value) != escrows.end(), "ERR::TASK_NOT_FOUND::escrow not found");

    //open disputes table, get dispute
    disputes_table disputes(get_self(), get_self().value);
    return disputes.get(task_id.value, "ERR::TASK_NOT_DISPUTED::escrow has no dispute");
}

//======================== notification handlers ========================

void taskescrow::catch_transfer(name from, name to, asset quantity, string memo)
{
    //only transfers into the contract are deposits
    if (to != get_self()) {
        return;
    }

    //open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    check(configs.exists(), "ERR::NOT_INITIALIZED::contract is not initialized");
    auto conf = configs.get();

    //ignore notifications from other token contracts
    if (get_first_receiver() != conf.token_contract) {
        return;
    }

    //validate
    check(quantity.symbol == conf.token_symbol, "ERR::INVALID_AMOUNT::only " + conf.token_symbol.code().to_string() + " deposits are accepted");

    //update account balance
    add_balance(from, quantity);

    //update state
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.deposited_funds += quantity;
    states.set(st, get_self());

    print("deposit: ", from, " ", quantity);
}

//======================== functions ========================

taskescrow::config taskescrow::get_config()
{
    //open config singleton
    config_singleton configs(get_self(), get_self().value);
    check(configs.exists(), "ERR::NOT_INITIALIZED::contract is not initialized");

    return configs.get();
}

void taskescrow::check_not_paused()
{
    state_singleton states(get_self(), get_self().value);
    check(!states.get().paused, "ERR::CONTRACT_PAUSED::contract is paused");
}

void taskescrow::require_admin(const config& conf)
{
    check(has_auth(conf.admin_acct), "ERR::UNAUTHORIZED::requires admin to authenticate");
}

void taskescrow::require_creator(const escrow& esc)
{
    check(has_auth(esc.creator), "ERR::UNAUTHORIZED::requires task creator to authenticate");
}

void taskescrow::require_contributor(const escrow& esc)
{
    check(esc.contributor != name(0) && has_auth(esc.contributor), "ERR::UNAUTHORIZED::requires assigned contributor to authenticate");
}

void taskescrow::require_party(const escrow& esc, name account)
{
    bool is_creator = account == esc.creator;
    bool is_contributor = esc.contributor != name(0) && account == esc.contributor;

    check(is_creator || is_contributor, "ERR::UNAUTHORIZED::only the task creator or contributor can dispute");
    check(has_auth(account), "ERR::UNAUTHORIZED::requires creator or contributor to authenticate");
}

void taskescrow::pull_funds(const config& conf, name from, asset quantity)
{
    //validate
    check(quantity.symbol == conf.token_symbol, "ERR::TRANSFER_FAILED::unsupported token symbol");

    //debit depositor
    sub_balance(from, quantity);

    //move into custody
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();
    st.deposited_funds -= quantity;
    st.escrowed_funds += quantity;
    states.set(st, get_self());
}

void taskescrow::push_funds(const config& conf, name to, asset quantity, string memo)
{
    //open state singleton, get state
    state_singleton states(get_self(), get_self().value);
    auto st = states.get();

    //validate
    check(st.escrowed_funds >= quantity, "ERR::TRANSFER_FAILED::escrowed funds are insufficient");

    //release from custody
    st.escrowed_funds -= quantity;
    states.set(st, get_self());

    send_transfer(conf, to, quantity, memo);
}

void taskescrow::send_transfer(const config& conf, name to, asset quantity, string memo)
{
    action(permission_level{get_self(), name("active")}, conf.token_contract, name("transfer"), make_tuple(
        get_self(), //from
        to, //to
        quantity, //quantity
        memo //memo
    )).send();
}

void taskescrow::sub_balance(name account_owner, asset quantity)
{
    //open accounts table, get account
    accounts_table accounts(get_self(), account_owner.value);
    auto& acct = accounts.get(quantity.symbol.code().raw(), "ERR::TRANSFER_FAILED::no deposit found for account");

    //validate
    check(acct.balance >= quantity, "ERR::TRANSFER_FAILED::insufficient deposit >>> needed: " + asset(quantity.amount - acct.balance.amount, quantity.symbol).to_string());

    if (acct.balance == quantity) {
        //clean up RAM because new balance is zero
        accounts.erase(acct);
    } else {
        //subtract quantity from balance
        accounts.modify(acct, same_payer, [&](auto& col) {
            col.balance -= quantity;
        });
    }
}

void taskescrow::add_balance(name account_owner, asset quantity)
{
    //open accounts table, get account
    accounts_table accounts(get_self(), account_owner.value);
    auto acct = accounts.find(quantity.symbol.code().raw());

    //emplace account if not found, update if exists
    if (acct == accounts.end()) {
        //make new account entry
        accounts.emplace(get_self(), [&](auto& col) {
            col.balance = quantity;
        });
    } else {
        //update existing account
        accounts.modify(*acct, same_payer, [&](auto& col) {
            col.balance += quantity;
        });
    }
}

bool taskescrow::valid_outcome(name outcome)
{
    return outcome == name("refund") || outcome == name("fullpayment") || outcome == name("split");
}
