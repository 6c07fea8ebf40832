// src/data/persistence_store.cpp
#include "trade_pilot/data/persistence_store.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include "trade_pilot/core/logger.hpp"
#include "trade_pilot/core/time_utils.hpp"

namespace trade_pilot {

nlohmann::json trade_to_json(const Trade& trade) {
    nlohmann::json j;
    j["id"] = trade.id;
    j["pair"] = trade.pair;
    j["side"] = side_to_string(trade.side);
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price ? nlohmann::json(*trade.exit_price) : nlohmann::json();
    j["amount"] = trade.amount;
    j["status"] = trade_status_to_string(trade.status);
    j["pnl"] = trade.pnl ? nlohmann::json(*trade.pnl) : nlohmann::json();
    j["timestamp"] = core::to_epoch_ms(trade.timestamp);
    j["stop_loss"] = trade.stop_loss;
    j["take_profit"] = trade.take_profit;
    j["stop_loss_pct"] = trade.stop_loss_pct;
    j["take_profit_pct"] = trade.take_profit_pct;
    j["mode"] = account_mode_to_string(trade.mode);
    return j;
}

Result<Trade> trade_from_json(const nlohmann::json& j) {
    try {
        Trade trade;
        trade.id = j.at("id").get<std::string>();
        trade.pair = j.at("pair").get<std::string>();

        auto side = side_from_string(j.at("side").get<std::string>());
        auto status = trade_status_from_string(j.at("status").get<std::string>());
        if (!side || !status) {
            return make_error<Trade>(ErrorCode::INVALID_DATA,
                                     "Unknown side or status in trade " + trade.id,
                                     "JsonFileStore");
        }
        trade.side = *side;
        trade.status = *status;

        trade.entry_price = j.at("entry_price").get<double>();
        trade.amount = j.at("amount").get<double>();
        if (!std::isfinite(trade.entry_price) || trade.entry_price <= 0.0 ||
            !std::isfinite(trade.amount) || trade.amount <= 0.0) {
            return make_error<Trade>(ErrorCode::INVALID_DATA,
                                     "Non-positive entry price or amount in trade " + trade.id,
                                     "JsonFileStore");
        }
        if (j.contains("exit_price") && !j.at("exit_price").is_null()) {
            trade.exit_price = j.at("exit_price").get<double>();
        }
        if (j.contains("pnl") && !j.at("pnl").is_null()) {
            trade.pnl = j.at("pnl").get<double>();
        }
        trade.timestamp = core::from_epoch_ms(j.value("timestamp", int64_t{0}));
        trade.stop_loss = j.value("stop_loss", 0.0);
        trade.take_profit = j.value("take_profit", 0.0);
        trade.stop_loss_pct = j.value("stop_loss_pct", 0.0);
        trade.take_profit_pct = j.value("take_profit_pct", 0.0);

        trade.mode = AccountMode::TRIAL;
        if (j.contains("mode") && j.at("mode").is_string()) {
            auto mode = account_mode_from_string(j.at("mode").get<std::string>());
            if (mode) {
                trade.mode = *mode;
            }
        }

        // Older records carry only the price levels
        if (trade.stop_loss_pct <= 0.0 && trade.entry_price > 0.0 && trade.stop_loss > 0.0) {
            trade.stop_loss_pct =
                std::abs(trade.entry_price - trade.stop_loss) / trade.entry_price * 100.0;
        }
        if (trade.take_profit_pct <= 0.0 && trade.entry_price > 0.0 && trade.take_profit > 0.0) {
            trade.take_profit_pct =
                std::abs(trade.take_profit - trade.entry_price) / trade.entry_price * 100.0;
        }
        return trade;
    } catch (const nlohmann::json::exception& e) {
        return make_error<Trade>(ErrorCode::JSON_PARSE_ERROR,
                                 std::string("Malformed trade record: ") + e.what(),
                                 "JsonFileStore");
    }
}

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {}

PersistedState JsonFileStore::decode(const nlohmann::json& document,
                                     const PersistedState& defaults) {
    PersistedState state = defaults;
    if (!document.is_object()) {
        WARN("Persisted state is not an object, using defaults");
        return state;
    }

    if (document.contains("trades")) {
        const auto& trades = document.at("trades");
        std::vector<Trade> restored;
        bool corrupt = !trades.is_array();
        if (!corrupt) {
            for (const auto& item : trades) {
                auto trade = trade_from_json(item);
                if (trade.is_error()) {
                    WARN("Discarding trades section: " << trade.error()->what());
                    corrupt = true;
                    break;
                }
                restored.push_back(trade.value());
            }
        }
        state.trades = corrupt ? std::vector<Trade>{} : std::move(restored);
    }

    if (document.contains("risk")) {
        RiskConfiguration merged = defaults.risk;
        try {
            merged.from_json(document.at("risk"));
            auto valid = RiskConfigValidator().check(merged);
            if (valid.is_ok()) {
                state.risk = merged;
            } else {
                WARN("Discarding risk section: " << valid.error()->what());
                state.risk = defaults.risk;
            }
        } catch (const nlohmann::json::exception& e) {
            WARN("Discarding risk section: " << e.what());
            state.risk = defaults.risk;
        }
    }

    if (document.contains("balances") && document.at("balances").is_object()) {
        const auto& balances = document.at("balances");
        if (balances.contains("TRIAL") && balances.at("TRIAL").is_number()) {
            state.balances.trial = balances.at("TRIAL").get<double>();
        }
        if (balances.contains("LIVE") && balances.at("LIVE").is_number()) {
            state.balances.live = balances.at("LIVE").get<double>();
        }
    }

    if (document.contains("session") && document.at("session").is_object()) {
        const auto& session = document.at("session");
        try {
            SessionInfo info;
            info.user_id = session.value("user_id", std::string{});
            info.name = session.value("name", std::string{});
            info.email = session.value("email", std::string{});
            info.role = session.value("role", std::string{});
            state.session = info;
        } catch (const nlohmann::json::exception& e) {
            WARN("Discarding session section: " << e.what());
            state.session = defaults.session;
        }
    }

    return state;
}

nlohmann::json JsonFileStore::encode(const PersistedState& state) {
    nlohmann::json document;
    document["trades"] = nlohmann::json::array();
    for (const auto& trade : state.trades) {
        document["trades"].push_back(trade_to_json(trade));
    }
    document["risk"] = state.risk.to_json();
    document["balances"] = {{"TRIAL", state.balances.trial}, {"LIVE", state.balances.live}};
    if (state.session) {
        document["session"] = {{"user_id", state.session->user_id},
                               {"name", state.session->name},
                               {"email", state.session->email},
                               {"role", state.session->role}};
    } else {
        document["session"] = nullptr;
    }
    return document;
}

Result<PersistedState> JsonFileStore::load(const PersistedState& defaults) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        INFO("No persisted state at " << path_ << ", starting from defaults");
        return defaults;
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        WARN("Persisted state at " << path_ << " is unreadable, reinitializing: " << e.what());
        return defaults;
    }

    PersistedState state = decode(document, defaults);
    INFO("Loaded persisted state from " << path_ << " with " << state.trades.size()
                                        << " trades");
    return state;
}

Result<void> JsonFileStore::save(const PersistedState& state) {
    std::string tmp_path = path_ + ".tmp";
    try {
        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Unable to open file for writing: " + tmp_path,
                                    "JsonFileStore");
        }
        file << encode(state).dump(2);
        file.close();
        if (file.fail()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + tmp_path,
                                    "JsonFileStore");
        }
        std::filesystem::rename(tmp_path, path_);
    } catch (const std::filesystem::filesystem_error& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Failed to persist state: ") + e.what(),
                                "JsonFileStore");
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Failed to encode state: ") + e.what(),
                                "JsonFileStore");
    }
    return Result<void>();
}

}  // namespace trade_pilot
