#include <cassert>
#include <initializer_list>
#include <string>

#include "moveeval/model/board.hpp"

using namespace moveeval::model;

static Square sq(char file, int rank)
{
  return static_cast<Square>((rank - 1) * 8 + (file - 'a'));
}

static bool play(Board& b, std::initializer_list<const char*> moves)
{
  for (const char* m : moves)
    if (!b.doMoveUCI(m)) return false;
  return true;
}

int main()
{
  // Opening moves apply; replaying a pawn push that already happened fails.
  {
    Board b;
    assert(play(b, {"e2e4", "e7e5", "g1f3", "b8c6"}));
    assert(b.pieceAt(sq('f', 3)).type == PieceType::Knight);
    assert(b.pieceAt(sq('c', 6)).color == Color::Black);
    assert(b.sideToMove() == Color::White);
    assert(!b.doMoveUCI("e2e4"));
  }

  // Malformed tokens leave the position untouched.
  {
    Board b;
    assert(!b.doMoveUCI(""));
    assert(!b.doMoveUCI("e2"));
    assert(!b.doMoveUCI("z9e4"));
    assert(!b.doMoveUCI("e2e4x"));
    assert(!b.doMoveUCI("e2e4q"));
    assert(!b.doMoveUCI("e7e5"));  // wrong side
    assert(b.sideToMove() == Color::White);
    assert(b.pieceAt(sq('e', 2)).type == PieceType::Pawn);
  }

  // Castling needs an empty path and moves the rook.
  {
    Board b;
    assert(!b.doMoveUCI("e1g1"));
    assert(play(b, {"e2e4", "e7e5", "g1f3", "b8c6", "f1c4", "g8f6", "e1g1"}));
    assert(b.pieceAt(sq('g', 1)).type == PieceType::King);
    assert(b.pieceAt(sq('f', 1)).type == PieceType::Rook);
    assert(b.pieceAt(sq('h', 1)).isNone());
    assert((b.castlingRights() & (WK | WQ)) == 0);
  }

  // No castling out of check; the checked king may take the unprotected checker.
  {
    Board b;
    assert(play(b, {"g2g3", "e7e6", "g1f3", "f8c5", "f1h3", "c5f2"}));
    assert(b.inCheck(Color::White));
    assert(!b.doMoveUCI("e1g1"));
    assert(!b.doMoveUCI("a2a3"));
    assert(b.doMoveUCI("e1f2"));
  }

  // En passant is available only immediately after the double push.
  {
    Board b;
    assert(play(b, {"e2e4", "a7a6", "e4e5", "d7d5"}));
    assert(b.enPassantSquare() == sq('d', 6));
    assert(b.doMoveUCI("e5d6"));
    assert(b.pieceAt(sq('d', 5)).isNone());
    assert(b.pieceAt(sq('d', 6)).type == PieceType::Pawn);

    Board late;
    assert(play(late, {"e2e4", "a7a6", "e4e5", "d7d5", "h2h3", "h7h6"}));
    assert(!late.doMoveUCI("e5d6"));
  }

  // Promotion is required on the last rank.
  {
    Board b;
    assert(play(b, {"a2a4", "b7b5", "a4b5", "a7a6", "b5a6", "c8b7", "a6b7", "g8f6"}));
    assert(!b.doMoveUCI("b7a8"));
    assert(!b.doMoveUCI("b7a8k"));
    assert(!b.doMoveUCI("b7a8Q"));
    assert(!b.doMoveUCI("b7a8N"));
    assert(b.doMoveUCI("b7a8q"));
    assert(b.pieceAt(sq('a', 8)).type == PieceType::Queen);
    assert(b.pieceAt(sq('a', 8)).color == Color::White);
    assert((b.castlingRights() & BQ) == 0);
  }

  // Moves that leave the own king in check are rejected.
  {
    Board b;
    assert(play(b, {"e2e4", "f7f6", "d1h5"}));
    assert(b.inCheck(Color::Black));
    assert(!b.doMoveUCI("a7a6"));
    assert(b.doMoveUCI("g7g6"));
    assert(!b.inCheck(Color::Black));
  }

  return 0;
}
