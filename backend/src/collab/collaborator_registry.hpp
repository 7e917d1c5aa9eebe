#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "collab/lazy_sale.hpp"
#include "collab/verification.hpp"

// Resolves pluggable collaborators at call time.
// - buyer verifiers and seller registries by name
// - price oracles and lazy deliverers by token contract
class CollaboratorRegistry {
public:
    void register_seller_authorization(std::string name, std::shared_ptr<ISellerAuthorization> auth) {
        register_into(seller_auth_, std::move(name), std::move(auth));
    }
    void register_buyer_verifier(std::string name, std::shared_ptr<IBuyerVerifier> verifier) {
        register_into(verifiers_, std::move(name), std::move(verifier));
    }
    void register_price_oracle(std::string contract, std::shared_ptr<IPriceOracle> oracle) {
        register_into(oracles_, std::move(contract), std::move(oracle));
    }
    void register_lazy_deliverer(std::string contract, std::shared_ptr<ILazyDeliverer> deliverer) {
        register_into(deliverers_, std::move(contract), std::move(deliverer));
    }

    ISellerAuthorization* find_seller_authorization(std::string_view name) const {
        return find_in(seller_auth_, name);
    }
    IBuyerVerifier* find_buyer_verifier(std::string_view name) const {
        return find_in(verifiers_, name);
    }
    IPriceOracle* find_price_oracle(std::string_view contract) const {
        return find_in(oracles_, contract);
    }
    ILazyDeliverer* find_lazy_deliverer(std::string_view contract) const {
        return find_in(deliverers_, contract);
    }

    std::vector<std::string> list_verifier_names() const {
        std::vector<std::string> names;
        names.reserve(verifiers_.size());
        for (const auto& kv : verifiers_) {
            names.push_back(kv.first);
        }
        return names;
    }

private:
    template <class T>
    using Table = std::unordered_map<std::string, std::shared_ptr<T>>;

    template <class T>
    static void register_into(Table<T>& table, std::string key, std::shared_ptr<T> value) {
        if (key.empty() || !value) {
            return;
        }
        table[std::move(key)] = std::move(value);
    }

    template <class T>
    static T* find_in(const Table<T>& table, std::string_view key) {
        auto it = table.find(std::string(key));
        if (it == table.end()) {
            return nullptr;
        }
        return it->second.get();
    }

    Table<ISellerAuthorization> seller_auth_;
    Table<IBuyerVerifier> verifiers_;
    Table<IPriceOracle> oracles_;
    Table<ILazyDeliverer> deliverers_;
};
