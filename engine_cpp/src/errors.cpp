/// @file errors.cpp

#include <evochess/errors.hpp>

namespace evochess {

std::string_view to_string(MoveError e) noexcept {
    switch (e) {
        case MoveError::None:
            return "none";
        case MoveError::InvalidSquare:
            return "invalid square";
        case MoveError::EmptySource:
            return "no piece on source square";
        case MoveError::WrongSide:
            return "piece does not belong to the side to move";
        case MoveError::TargetsKing:
            return "a king can never be captured";
        case MoveError::FriendlyTarget:
            return "destination holds a friendly piece";
        case MoveError::IllegalMove:
            return "illegal move";
        case MoveError::LeavesKingInCheck:
            return "move leaves own king in check";
        case MoveError::CustomRuleViolation:
            return "rejected by custom rule";
        case MoveError::GameOver:
            return "game is over";
        case MoveError::InvalidNotation:
            return "unrecognised move notation";
        case MoveError::DashPending:
            return "only the dashing knight may move";
        case MoveError::InternalDesync:
            return "engine state out of sync";
        case MoveError::InvalidPosition:
            return "reconstructed position is invalid";
    }
    return "unknown";
}

}  // namespace evochess
