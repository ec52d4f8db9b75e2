#pragma once

#include "common/types.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace solcore {
namespace validation {

using namespace solcore::common;

/**
 * Account capability interface
 *
 * Concrete account kinds provide their balance and a one-line rendering.
 * Rent exemption defaults to comparing the balance against
 * RENT_EXEMPT_MIN_LAMPORTS; kinds may override it.
 */
class Account {
public:
    /// Minimum balance for a zero-data account to be rent exempt
    static constexpr Lamports RENT_EXEMPT_MIN_LAMPORTS = 890'880;

    virtual ~Account() = default;

    virtual Lamports lamports() const = 0;

    /**
     * Render one human-readable line describing the account
     * @note Purely observational; has no effect on any predicate
     */
    virtual void display_info(std::ostream& out) const = 0;

    virtual bool is_rent_exempt() const {
        return lamports() >= RENT_EXEMPT_MIN_LAMPORTS;
    }

    /// Short kind name ("user", "program")
    virtual std::string kind() const = 0;
};

/**
 * Wallet account holding its own lamport balance
 */
class UserAccount : public Account {
public:
    UserAccount(std::string name, Lamports lamports)
        : name_(std::move(name)), lamports_(lamports) {}

    Lamports lamports() const override { return lamports_; }
    void display_info(std::ostream& out) const override;
    std::string kind() const override { return "user"; }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    Lamports lamports_;
};

/**
 * Program account; its balance is the fixed PROGRAM_ACCOUNT_LAMPORTS
 */
class ProgramAccount : public Account {
public:
    static constexpr Lamports PROGRAM_ACCOUNT_LAMPORTS = 1'000'000;

    ProgramAccount(std::string id, bool executable)
        : id_(std::move(id)), executable_(executable) {}

    Lamports lamports() const override { return PROGRAM_ACCOUNT_LAMPORTS; }
    void display_info(std::ostream& out) const override;
    std::string kind() const override { return "program"; }

    const std::string& id() const { return id_; }
    bool is_executable() const { return executable_; }

private:
    std::string id_;
    bool executable_;
};

struct RentStatusEntry {
    size_t index;
    Lamports lamports;
    bool rent_exempt;
};

/**
 * Rent status of every account, in input order
 *
 * A null element is reported with zero lamports and not rent exempt.
 */
std::vector<RentStatusEntry> check_rent_exemption(
    const std::vector<std::unique_ptr<Account>>& accounts
);

/**
 * display_info() for every account followed by its rent status line;
 * null elements are skipped
 */
void render_accounts(
    const std::vector<std::unique_ptr<Account>>& accounts,
    std::ostream& out
);

} // namespace validation
} // namespace solcore
