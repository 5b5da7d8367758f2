/**
 * Command line front end over a SQLite-backed ledger.
 *
 *   crowdfund_cli <db> airdrop  <who> <lamports>
 *   crowdfund_cli <db> create   <admin> <name> <description>
 *   crowdfund_cli <db> donate   <donor> <admin-of-campaign> <lamports>
 *   crowdfund_cli <db> withdraw <admin> <lamports>
 *   crowdfund_cli <db> balance  <who>
 *   crowdfund_cli <db> show     <admin-of-campaign>
 *   crowdfund_cli <db> list
 *
 * Identities are 64-char hex public keys or labels hashed into one.
 */

#include <crowdfund.hpp>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

using namespace crowdfund;
using namespace crowdfund::ledger;
using namespace crowdfund::storage;

namespace {

    void usage() {
        std::cerr << "usage: crowdfund_cli <db> <command> [args...]\n"
                  << "  airdrop  <who> <lamports>\n"
                  << "  create   <admin> <name> <description>\n"
                  << "  donate   <donor> <campaign-admin> <lamports>\n"
                  << "  withdraw <admin> <lamports>\n"
                  << "  balance  <who>\n"
                  << "  show     <campaign-admin>\n"
                  << "  list" << std::endl;
    }

    dp::Result<Pubkey, dp::Error> identity(const std::string &arg) {
        if (arg.size() == Pubkey::SIZE * 2) {
            auto parsed = Pubkey::fromHex(arg);
            if (parsed.is_ok())
                return parsed;
        }
        return Pubkey::fromSeed(arg);
    }

    bool parseAmount(const std::string &arg, dp::u64 &out) {
        if (arg.empty() || arg.find_first_not_of("0123456789") != std::string::npos)
            return false;
        try {
            out = std::stoull(arg);
        } catch (const std::out_of_range &) {
            return false;
        }
        return true;
    }

    int report(const dp::Error &error) {
        std::cerr << "error " << error.code << " (" << errorName(error.code) << "): " << error.message.c_str()
                  << std::endl;
        return 1;
    }

    void printView(const CampaignView &view) {
        std::cout << view.address.toHex() << "\n"
                  << "  name:         " << view.campaign.name << "\n"
                  << "  description:  " << view.campaign.description << "\n"
                  << "  admin:        " << view.campaign.admin.toHex() << "\n"
                  << "  donated:      " << view.campaign.amount_donated << "\n"
                  << "  held:         " << view.held_balance << "\n"
                  << "  withdrawable: " << view.withdrawable() << std::endl;
    }

} // namespace

int main(int argc, char **argv) {
    if (argc < 3) {
        usage();
        return 2;
    }
    std::string db_path = argv[1];
    std::string command = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);

    SqliteHost host;
    if (!host.open(db_path) || !host.initializeSchema()) {
        std::cerr << "Failed to open database " << db_path << std::endl;
        return 1;
    }
    CampaignLedger ledger(host);

    auto expect = [&](size_t n) {
        if (args.size() != n) {
            usage();
            return false;
        }
        return true;
    };

    if (command == "list") {
        if (!expect(0))
            return 2;
        auto views = ledger.listCampaigns();
        if (!views.is_ok())
            return report(views.error());
        for (const auto &view : views.value())
            printView(view);
        std::cout << views.value().size() << " campaign(s)" << std::endl;
        return 0;
    }

    if (args.empty()) {
        usage();
        return 2;
    }
    auto who = identity(args[0]);
    if (!who.is_ok())
        return report(who.error());

    dp::u64 amount = 0;

    if (command == "airdrop") {
        if (!expect(2) || !parseAmount(args[1], amount))
            return 2;
        auto result = host.airdrop(who.value(), amount);
        if (!result.is_ok())
            return report(result.error());
        std::cout << who.value().toHex() << " balance " << host.balance(who.value()).value() << std::endl;
        return 0;
    }

    if (command == "balance") {
        if (!expect(1))
            return 2;
        auto balance = host.balance(who.value());
        if (!balance.is_ok())
            return report(balance.error());
        std::cout << balance.value() << std::endl;
        return 0;
    }

    if (command == "create") {
        if (!expect(3))
            return 2;
        auto address = ledger.campaignAddress(who.value());
        if (!address.is_ok())
            return report(address.error());
        auto result = ledger.execute(who.value(), Instruction::create(address.value(), args[1], args[2]));
        if (!result.is_ok())
            return report(result.error());
        std::cout << address.value().toHex() << std::endl;
        return 0;
    }

    if (command == "donate") {
        if (!expect(3) || !parseAmount(args[2], amount))
            return 2;
        auto owner = identity(args[1]);
        if (!owner.is_ok())
            return report(owner.error());
        auto address = ledger.campaignAddress(owner.value());
        if (!address.is_ok())
            return report(address.error());
        auto result = ledger.execute(who.value(), Instruction::donate(address.value(), amount));
        if (!result.is_ok())
            return report(result.error());
        return 0;
    }

    if (command == "withdraw") {
        if (!expect(2) || !parseAmount(args[1], amount))
            return 2;
        auto address = ledger.campaignAddress(who.value());
        if (!address.is_ok())
            return report(address.error());
        auto result = ledger.execute(who.value(), Instruction::withdraw(address.value(), amount));
        if (!result.is_ok())
            return report(result.error());
        return 0;
    }

    if (command == "show") {
        if (!expect(1))
            return 2;
        auto address = ledger.campaignAddress(who.value());
        if (!address.is_ok())
            return report(address.error());
        auto view = ledger.getCampaignView(address.value());
        if (!view.is_ok())
            return report(view.error());
        printView(view.value());
        return 0;
    }

    usage();
    return 2;
}
