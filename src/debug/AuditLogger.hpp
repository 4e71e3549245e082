//
// Created by Malik T on 18/10/2025.
//

#ifndef CARDSIM_AUDITLOGGER_HPP
#define CARDSIM_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Table.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace cardsim::core::debug
{
    // Plain-text transcript of one session: header, one block per action, footer.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto IsOpen() const -> bool { return out_.is_open(); }

        // Session header (game, seed, deck size)
        auto start(Table const& table, std::uint64_t seed) -> void;

        // Action as dispatched by the caller
        auto action(PlayerAction const& a) -> void;

        // Step result: outcome, verdict, messages and the table after the step, or the refusal
        auto result(ActionResult const& r) -> void;

        // Footer with the final table
        auto end(Table const& table) -> void;

    private:
        std::ofstream out_;
    };

    // Compact form used in transcripts, e.g. "TH", "AS"
    auto ShortCard(Card const& c) -> std::string;
    auto DescribeAction(PlayerAction const& a) -> std::string;
    auto DescribeSnapshot(TableSnapshot const& s) -> std::string;
}

#endif //CARDSIM_AUDITLOGGER_HPP
