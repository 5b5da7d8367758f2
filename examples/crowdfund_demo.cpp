/**
 * Example: a school fundraiser on the in-memory host
 *
 * This demo shows how to:
 * 1. Fund identities and create a campaign at its derived address
 * 2. Accept donations from several donors
 * 3. Withdraw as the admin and see the reserve floor hold
 */

#include <crowdfund.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace crowdfund;
using namespace crowdfund::ledger;
using namespace crowdfund::storage;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

std::string sol(dp::u64 lamports) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(9) << static_cast<double>(lamports) / LAMPORTS_PER_SOL << " SOL";
    return out.str();
}

void printView(const CampaignView &view) {
    std::cout << "  Campaign:     " << view.campaign.name << std::endl;
    std::cout << "  Description:  " << view.campaign.description << std::endl;
    std::cout << "  Address:      " << view.address.toHex() << std::endl;
    std::cout << "  Admin:        " << view.campaign.admin.toHex() << std::endl;
    std::cout << "  Donated:      " << sol(view.campaign.amount_donated) << std::endl;
    std::cout << "  Held:         " << sol(view.held_balance) << std::endl;
    std::cout << "  Reserve:      " << sol(view.minimum_reserve) << std::endl;
    std::cout << "  Withdrawable: " << sol(view.withdrawable()) << std::endl;
}

int main() {
    printSeparator("Crowdfunding Ledger Demo");

    MemoryHost host;
    LedgerOptions options;
    auto program = Pubkey::fromSeed("crowdfund-program");
    auto admin = Pubkey::fromSeed("school-admin");
    auto alice = Pubkey::fromSeed("alice");
    auto bob = Pubkey::fromSeed("bob");
    if (!program.is_ok() || !admin.is_ok() || !alice.is_ok() || !bob.is_ok()) {
        std::cerr << "Failed to derive identities" << std::endl;
        return 1;
    }
    options.program_id = program.value();
    CampaignLedger ledger(host, options);

    for (const auto &key : {admin.value(), alice.value(), bob.value()}) {
        auto funded = host.airdrop(key, LAMPORTS_PER_SOL);
        if (!funded.is_ok()) {
            std::cerr << "Airdrop failed: " << funded.error().message.c_str() << std::endl;
            return 1;
        }
    }

    // ===========================================
    // Step 1: Create
    // ===========================================
    printSeparator("Step 1: Create campaign");

    auto created = ledger.create(admin.value(), "Help Build a School", "Funding for rural education");
    if (!created.is_ok()) {
        std::cerr << "Create failed: " << errorName(created.error().code) << std::endl;
        return 1;
    }
    auto address = ledger.campaignAddress(admin.value()).value();

    // ===========================================
    // Step 2: Donate
    // ===========================================
    printSeparator("Step 2: Donations");

    if (!ledger.donate(alice.value(), address, LAMPORTS_PER_SOL / 5).is_ok() ||
        !ledger.donate(bob.value(), address, LAMPORTS_PER_SOL / 10).is_ok()) {
        std::cerr << "Donation failed" << std::endl;
        return 1;
    }
    printView(ledger.getCampaignView(address).value());

    // ===========================================
    // Step 3: Withdraw
    // ===========================================
    printSeparator("Step 3: Withdrawals");

    auto stolen = ledger.withdraw(bob.value(), address, 1);
    std::cout << "Bob tries to withdraw: " << (stolen.is_ok() ? "Ok" : errorName(stolen.error().code)) << std::endl;

    auto too_much = ledger.withdraw(admin.value(), address, LAMPORTS_PER_SOL);
    std::cout << "Admin asks for 1 SOL: " << (too_much.is_ok() ? "Ok" : errorName(too_much.error().code))
              << std::endl;

    auto payout = ledger.withdraw(admin.value(), address, LAMPORTS_PER_SOL / 5);
    std::cout << "Admin withdraws 0.2 SOL: " << (payout.is_ok() ? "Ok" : errorName(payout.error().code))
              << std::endl;

    printView(ledger.getCampaignView(address).value());

    printSeparator("Balances");
    std::cout << "  Admin: " << sol(host.balance(admin.value()).value()) << std::endl;
    std::cout << "  Alice: " << sol(host.balance(alice.value()).value()) << std::endl;
    std::cout << "  Bob:   " << sol(host.balance(bob.value()).value()) << std::endl;

    return 0;
}
