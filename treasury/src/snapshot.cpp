#include "snapshot.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>

namespace {

const nlohmann::json* find_field(const nlohmann::json& record,
                                 std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = record.find(name);
        if (it != record.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string require_string(const nlohmann::json& record, const std::string& kind,
                           std::initializer_list<const char*> names) {
    const nlohmann::json* field = find_field(record, names);
    if (!field) {
        throw MalformedRecordError(kind, std::string("missing field '") + *names.begin() + "'");
    }
    if (!field->is_string()) {
        throw MalformedRecordError(kind, std::string("field '") + *names.begin() + "' is not a string");
    }
    return field->get<std::string>();
}

std::string optional_string(const nlohmann::json& record,
                            std::initializer_list<const char*> names) {
    const nlohmann::json* field = find_field(record, names);
    if (!field || !field->is_string()) return "";
    return field->get<std::string>();
}

double require_number(const nlohmann::json& record, const std::string& kind,
                      std::initializer_list<const char*> names) {
    const nlohmann::json* field = find_field(record, names);
    if (!field) {
        throw MalformedRecordError(kind, std::string("missing field '") + *names.begin() + "'");
    }
    if (field->is_number()) {
        return field->get<double>();
    }
    if (field->is_string()) {
        // Exported spreadsheets sometimes carry numbers as text
        const std::string text = field->get<std::string>();
        size_t used = 0;
        double value = 0.0;
        try {
            value = std::stod(text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used > 0 && used == text.size()) return value;
        throw MalformedRecordError(kind, "non-numeric value '" + text + "'");
    }
    throw MalformedRecordError(kind, std::string("field '") + *names.begin() + "' is not numeric");
}

bool optional_bool(const nlohmann::json& record, const char* name, bool default_val) {
    auto it = record.find(name);
    if (it == record.end() || !it->is_boolean()) return default_val;
    return it->get<bool>();
}

std::string require_date(const std::string& kind, const std::string& value) {
    auto date = util::iso_date(value);
    if (!date) {
        throw MalformedRecordError(kind, "invalid date '" + value + "'");
    }
    return *date;
}

void require_currency(const std::string& kind, const std::string& code) {
    if (!util::is_currency_code(code)) {
        throw MalformedRecordError(kind, "unknown currency code '" + code + "'");
    }
}

BankAccount parse_account(const nlohmann::json& r) {
    BankAccount a;
    a.account_id = require_string(r, "account", {"account_id", "account_number"});
    a.entity_code = require_string(r, "account", {"entity_code"});
    a.currency = require_string(r, "account", {"currency"});
    a.region = optional_string(r, {"region"});
    a.account_type = optional_string(r, {"type", "account_type"});
    a.active = optional_bool(r, "active", true);
    return a;
}

CashBalance parse_balance(const nlohmann::json& r) {
    CashBalance b;
    b.account_id = require_string(r, "balance", {"account_id", "account_number"});
    b.date = require_string(r, "balance", {"date", "balance_date"});
    b.currency = require_string(r, "balance", {"currency"});
    b.amount_local = require_number(r, "balance", {"amount_local", "balance_local"});
    return b;
}

FXRate parse_rate(const nlohmann::json& r) {
    FXRate fx;
    std::string pair = require_string(r, "fx_rate", {"pair", "currency_pair"});
    auto slash = pair.find('/');
    if (slash == std::string::npos) {
        throw MalformedRecordError("fx_rate", "pair '" + pair + "' is not BASE/QUOTE");
    }
    fx.base = pair.substr(0, slash);
    fx.quote = pair.substr(slash + 1);
    fx.rate = require_number(r, "fx_rate", {"rate"});
    fx.rate_date = require_string(r, "fx_rate", {"rate_date"});
    return fx;
}

LegalEntity parse_entity(const nlohmann::json& r) {
    LegalEntity e;
    e.entity_code = require_string(r, "entity", {"entity_code"});
    e.name = optional_string(r, {"name", "entity_name"});
    e.country = optional_string(r, {"country", "country_code"});
    e.region = optional_string(r, {"region"});
    return e;
}

CashPool parse_pool(const nlohmann::json& r) {
    CashPool p;
    p.pool_name = require_string(r, "pool", {"pool_name"});
    
    std::string type = require_string(r, "pool", {"type", "pool_type"});
    auto parsed = parse_pool_type(type);
    if (!parsed) {
        throw MalformedRecordError("pool", "unknown pool type '" + type + "'");
    }
    p.type = *parsed;
    
    p.region = optional_string(r, {"region"});
    p.header_account = optional_string(r, {"header_account"});
    p.currency = optional_string(r, {"currency"});
    p.active = optional_bool(r, "active", true);
    
    const nlohmann::json* participants = find_field(r, {"participant_account_ids", "participant_accounts"});
    if (participants) {
        if (!participants->is_array()) {
            throw MalformedRecordError("pool", "participants is not a list");
        }
        for (const auto& id : *participants) {
            if (!id.is_string()) {
                throw MalformedRecordError("pool", "participant id is not a string");
            }
            p.participant_account_ids.push_back(id.get<std::string>());
        }
    }
    return p;
}

} // namespace

const BankAccount* Snapshot::find_account(const std::string& account_id) const {
    auto it = account_index_.find(account_id);
    if (it == account_index_.end()) return nullptr;
    return &accounts_[it->second];
}

const LegalEntity* Snapshot::find_entity(const std::string& entity_code) const {
    auto it = entity_index_.find(entity_code);
    if (it == entity_index_.end()) return nullptr;
    return &entities_[it->second];
}

std::vector<CashBalance> Snapshot::balances_on(const std::string& date) const {
    std::vector<CashBalance> slice;
    for (const auto& b : balances_) {
        if (b.date == date) {
            slice.push_back(b);
        }
    }
    return slice;
}

std::vector<std::string> Snapshot::balance_dates() const {
    std::set<std::string> dates;
    for (const auto& b : balances_) {
        dates.insert(b.date);
    }
    return std::vector<std::string>(dates.begin(), dates.end());
}

void Snapshot::require_data() const {
    if (is_empty()) {
        throw SnapshotEmptyError(as_of_date_);
    }
}

SnapshotBuilder::SnapshotBuilder(const std::string& as_of_date)
    : as_of_date_(as_of_date)
{}

void SnapshotBuilder::reject(const std::string& kind, const std::string& reason) {
    spdlog::warn("Rejected {} record: {}", kind, reason);
    rejected_.push_back({kind, reason});
}

bool SnapshotBuilder::add_account(const BankAccount& account) {
    try {
        if (account.account_id.empty()) {
            throw MalformedRecordError("account", "empty account id");
        }
        if (account.entity_code.empty()) {
            throw MalformedRecordError("account", "account " + account.account_id + " has no entity");
        }
        require_currency("account", account.currency);
        accounts_.push_back(account);
        return true;
    } catch (const MalformedRecordError& e) {
        reject(e.kind(), e.reason());
        return false;
    }
}

bool SnapshotBuilder::add_balance(const CashBalance& balance) {
    try {
        if (balance.account_id.empty()) {
            throw MalformedRecordError("balance", "empty account id");
        }
        require_currency("balance", balance.currency);
        if (!std::isfinite(balance.amount_local)) {
            throw MalformedRecordError("balance", "non-finite amount for " + balance.account_id);
        }
        CashBalance b = balance;
        b.date = require_date("balance", balance.date);
        balances_.push_back(b);
        return true;
    } catch (const MalformedRecordError& e) {
        reject(e.kind(), e.reason());
        return false;
    }
}

bool SnapshotBuilder::add_rate(const FXRate& rate) {
    try {
        require_currency("fx_rate", rate.base);
        require_currency("fx_rate", rate.quote);
        if (rate.base == rate.quote) {
            throw MalformedRecordError("fx_rate", "pair " + rate.pair() + " has identical currencies");
        }
        if (!std::isfinite(rate.rate) || rate.rate <= 0.0) {
            throw MalformedRecordError("fx_rate", "non-positive rate for " + rate.pair());
        }
        FXRate fx = rate;
        fx.rate_date = require_date("fx_rate", rate.rate_date);
        rates_.push_back(fx);
        return true;
    } catch (const MalformedRecordError& e) {
        reject(e.kind(), e.reason());
        return false;
    }
}

bool SnapshotBuilder::add_entity(const LegalEntity& entity) {
    if (entity.entity_code.empty()) {
        reject("entity", "empty entity code");
        return false;
    }
    entities_.push_back(entity);
    return true;
}

bool SnapshotBuilder::add_pool(const CashPool& pool) {
    if (pool.pool_name.empty()) {
        reject("pool", "empty pool name");
        return false;
    }
    pools_.push_back(pool);
    return true;
}

template <typename Parse, typename Add>
void SnapshotBuilder::add_each(const nlohmann::json& records, const std::string& kind,
                               Parse parse, Add add) {
    if (records.is_null()) return;
    if (!records.is_array()) {
        reject(kind, "collection is not a list");
        return;
    }
    
    for (const auto& record : records) {
        try {
            if (!record.is_object()) {
                throw MalformedRecordError(kind, "record is not an object");
            }
            add(parse(record));
        } catch (const MalformedRecordError& e) {
            reject(e.kind(), e.reason());
        }
    }
}

void SnapshotBuilder::add_accounts(const nlohmann::json& records) {
    add_each(records, "account", parse_account,
             [this](const BankAccount& a) { add_account(a); });
}

void SnapshotBuilder::add_balances(const nlohmann::json& records) {
    add_each(records, "balance", parse_balance,
             [this](const CashBalance& b) { add_balance(b); });
}

void SnapshotBuilder::add_rates(const nlohmann::json& records) {
    add_each(records, "fx_rate", parse_rate,
             [this](const FXRate& r) { add_rate(r); });
}

void SnapshotBuilder::add_entities(const nlohmann::json& records) {
    add_each(records, "entity", parse_entity,
             [this](const LegalEntity& e) { add_entity(e); });
}

void SnapshotBuilder::add_pools(const nlohmann::json& records) {
    add_each(records, "pool", parse_pool,
             [this](const CashPool& p) { add_pool(p); });
}

Snapshot SnapshotBuilder::build() const {
    Snapshot snap;
    snap.as_of_date_ = as_of_date_;
    snap.rejected_ = rejected_;
    
    auto reject_late = [&snap](const std::string& kind, const std::string& reason) {
        spdlog::warn("Rejected {} record: {}", kind, reason);
        snap.rejected_.push_back({kind, reason});
    };
    
    // Duplicates keep the smallest record by full key, so input order never
    // decides which copy survives
    std::vector<LegalEntity> entities = entities_;
    std::sort(entities.begin(), entities.end(),
              [](const LegalEntity& a, const LegalEntity& b) {
                  return std::tie(a.entity_code, a.name, a.country, a.region)
                       < std::tie(b.entity_code, b.name, b.country, b.region);
              });
    for (const auto& e : entities) {
        if (snap.entity_index_.count(e.entity_code)) {
            reject_late("entity", "duplicate entity code " + e.entity_code);
            continue;
        }
        snap.entity_index_[e.entity_code] = 0;
        snap.entities_.push_back(e);
    }
    std::sort(snap.entities_.begin(), snap.entities_.end(),
              [](const LegalEntity& a, const LegalEntity& b) {
                  return a.entity_code < b.entity_code;
              });
    for (size_t i = 0; i < snap.entities_.size(); i++) {
        snap.entity_index_[snap.entities_[i].entity_code] = i;
    }
    
    // Accounts, with region resolved from the owning entity when absent
    std::vector<BankAccount> accounts = accounts_;
    std::sort(accounts.begin(), accounts.end(),
              [](const BankAccount& a, const BankAccount& b) {
                  return std::tie(a.account_id, a.entity_code, a.currency, a.region, a.account_type, a.active)
                       < std::tie(b.account_id, b.entity_code, b.currency, b.region, b.account_type, b.active);
              });
    for (auto a : accounts) {
        if (snap.account_index_.count(a.account_id)) {
            reject_late("account", "duplicate account id " + a.account_id);
            continue;
        }
        if (a.region.empty()) {
            const LegalEntity* entity = snap.find_entity(a.entity_code);
            a.region = (entity && !entity->region.empty()) ? entity->region : "UNKNOWN";
        }
        snap.account_index_[a.account_id] = 0;
        snap.accounts_.push_back(a);
    }
    std::sort(snap.accounts_.begin(), snap.accounts_.end(),
              [](const BankAccount& a, const BankAccount& b) {
                  return a.account_id < b.account_id;
              });
    for (size_t i = 0; i < snap.accounts_.size(); i++) {
        snap.account_index_[snap.accounts_[i].account_id] = i;
    }
    
    // Balances must reference a known account
    for (const auto& b : balances_) {
        if (!snap.account_index_.count(b.account_id)) {
            reject_late("balance", "unknown account " + b.account_id);
            continue;
        }
        snap.balances_.push_back(b);
    }
    std::sort(snap.balances_.begin(), snap.balances_.end(),
              [](const CashBalance& a, const CashBalance& b) {
                  return std::tie(a.date, a.account_id, a.currency, a.amount_local)
                       < std::tie(b.date, b.account_id, b.currency, b.amount_local);
              });
    snap.as_of_balances_ = snap.balances_on(as_of_date_);
    
    // Rates that disagree for the same pair and date are all dropped; the
    // pair falls back to older history or to an fx mismatch
    std::map<std::tuple<std::string, std::string>, std::vector<FXRate>> rates_by_day;
    for (const auto& r : rates_) {
        rates_by_day[{r.pair(), r.rate_date}].push_back(r);
    }
    for (const auto& [key, candidates] : rates_by_day) {
        bool agree = std::all_of(candidates.begin(), candidates.end(),
                                 [&candidates](const FXRate& r) {
                                     return r.rate == candidates.front().rate;
                                 });
        if (!agree) {
            for (const auto& r : candidates) {
                reject_late("fx_rate", fmt::format("conflicting rate {} for {} on {}",
                                                   r.rate, r.pair(), r.rate_date));
            }
            continue;
        }
        snap.rates_.add(candidates.front());
    }
    
    std::vector<CashPool> pools = pools_;
    std::sort(pools.begin(), pools.end(),
              [](const CashPool& a, const CashPool& b) {
                  return std::tie(a.pool_name, a.type, a.region, a.header_account, a.currency,
                                  a.participant_account_ids, a.active)
                       < std::tie(b.pool_name, b.type, b.region, b.header_account, b.currency,
                                  b.participant_account_ids, b.active);
              });
    std::set<std::string> pool_names;
    for (const auto& p : pools) {
        if (!pool_names.insert(p.pool_name).second) {
            reject_late("pool", "duplicate pool name " + p.pool_name);
            continue;
        }
        snap.pools_.push_back(p);
    }
    std::sort(snap.pools_.begin(), snap.pools_.end(),
              [](const CashPool& a, const CashPool& b) {
                  return a.pool_name < b.pool_name;
              });
    
    spdlog::debug("Snapshot {}: {} accounts, {} balances ({} as of date), {} rates, {} pools, {} rejected",
                  as_of_date_, snap.accounts_.size(), snap.balances_.size(),
                  snap.as_of_balances_.size(), snap.rates_.size(), snap.pools_.size(),
                  snap.rejected_.size());
    
    return snap;
}

Snapshot SnapshotBuilder::from_json(const nlohmann::json& doc, const std::string& as_of_date) {
    SnapshotBuilder builder(as_of_date);
    builder.add_entities(doc.value("entities", nlohmann::json::array()));
    builder.add_accounts(doc.value("accounts", nlohmann::json::array()));
    builder.add_balances(doc.value("balances", nlohmann::json::array()));
    builder.add_rates(doc.value("fx_rates", nlohmann::json::array()));
    builder.add_pools(doc.value("pools", nlohmann::json::array()));
    return builder.build();
}
