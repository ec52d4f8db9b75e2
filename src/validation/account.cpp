#include "validation/account.h"
#include "common/logging.h"
#include <ostream>

namespace solcore {
namespace validation {

void UserAccount::display_info(std::ostream& out) const {
    out << "User Account: " << name_ << ", Balance: " << lamports_ << " lamports" << std::endl;
}

void ProgramAccount::display_info(std::ostream& out) const {
    out << "Program Account: " << id_ << ", Executable: " << (executable_ ? "true" : "false")
        << std::endl;
}

std::vector<RentStatusEntry> check_rent_exemption(
    const std::vector<std::unique_ptr<Account>>& accounts) {

    std::vector<RentStatusEntry> report;
    report.reserve(accounts.size());

    size_t exempt = 0;
    for (size_t i = 0; i < accounts.size(); ++i) {
        const auto& account = accounts[i];
        if (!account) {
            report.push_back(RentStatusEntry{i, 0, false});
            continue;
        }

        RentStatusEntry entry{i, account->lamports(), account->is_rent_exempt()};
        if (entry.rent_exempt) {
            ++exempt;
        }
        report.push_back(entry);
    }

    LOG_DEBUG("validation", "Rent check: ", exempt, "/", accounts.size(), " accounts exempt");
    return report;
}

void render_accounts(
    const std::vector<std::unique_ptr<Account>>& accounts,
    std::ostream& out) {

    for (const auto& account : accounts) {
        if (!account) {
            continue;
        }
        account->display_info(out);
        out << "Rent-exempt: " << (account->is_rent_exempt() ? "true" : "false") << std::endl;
    }
}

} // namespace validation
} // namespace solcore
