#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace moveeval::model {

using Square = std::uint8_t;
constexpr Square NO_SQUARE = 64;

enum class Color : std::uint8_t { White = 0, Black = 1 };

constexpr Color operator~(Color c) noexcept {
  return c == Color::White ? Color::Black : Color::White;
}

enum class PieceType : std::uint8_t { None = 0, Pawn, Knight, Bishop, Rook, Queen, King };

struct Piece {
  PieceType type = PieceType::None;
  Color color = Color::White;
  constexpr bool isNone() const noexcept { return type == PieceType::None; }
};

enum Castling : std::uint8_t { WK = 1 << 0, WQ = 1 << 1, BK = 1 << 2, BQ = 1 << 3 };

// Mailbox board that replays games in coordinate notation and rejects illegal moves.
class Board {
 public:
  Board();

  void setStartPosition();

  // Applies "e2e4" / "e7e8q" style moves. Returns false and leaves the
  // position untouched when the token is malformed or the move is illegal.
  bool doMoveUCI(const std::string& uciMove);

  Piece pieceAt(Square sq) const { return m_squares[sq]; }
  Color sideToMove() const noexcept { return m_stm; }
  Square enPassantSquare() const noexcept { return m_ep; }
  std::uint8_t castlingRights() const noexcept { return m_castling; }
  bool inCheck(Color side) const;

 private:
  bool isAttacked(Square sq, Color by) const;
  bool pseudoLegal(Square from, Square to, PieceType promo) const;
  bool castleLegal(Square from, Square to) const;
  void applyUnchecked(Square from, Square to, PieceType promo);
  Square kingSquare(Color side) const;

  std::array<Piece, 64> m_squares{};
  Color m_stm = Color::White;
  std::uint8_t m_castling = 0;
  Square m_ep = NO_SQUARE;
};

}  // namespace moveeval::model
