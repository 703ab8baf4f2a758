#include "moveeval/model/board.hpp"

#include <cstdlib>
#include <initializer_list>

namespace moveeval::model {

namespace {

constexpr int file_of(Square s) noexcept { return s & 7; }
constexpr int rank_of(Square s) noexcept { return s >> 3; }

constexpr Square at(int file, int rank) noexcept {
  return (static_cast<unsigned>(file) < 8u && static_cast<unsigned>(rank) < 8u)
             ? static_cast<Square>(rank * 8 + file)
             : NO_SQUARE;
}

inline Square squareFromUCI(const char* sq) noexcept {
  return at(sq[0] - 'a', sq[1] - '1');
}

constexpr Square A1 = 0, D1 = 3, E1 = 4, F1 = 5, H1 = 7;
constexpr Square A8 = 56, D8 = 59, E8 = 60, F8 = 61, H8 = 63;

constexpr int KNIGHT_D[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2},
                                {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int KING_D[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1},
                              {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int DIAG_D[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int ORTHO_D[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

}  // namespace

Board::Board() { setStartPosition(); }

void Board::setStartPosition() {
  m_squares.fill(Piece{});
  constexpr PieceType back[8] = {PieceType::Rook,  PieceType::Knight, PieceType::Bishop,
                                 PieceType::Queen, PieceType::King,   PieceType::Bishop,
                                 PieceType::Knight, PieceType::Rook};
  for (int f = 0; f < 8; ++f) {
    m_squares[at(f, 0)] = Piece{back[f], Color::White};
    m_squares[at(f, 1)] = Piece{PieceType::Pawn, Color::White};
    m_squares[at(f, 6)] = Piece{PieceType::Pawn, Color::Black};
    m_squares[at(f, 7)] = Piece{back[f], Color::Black};
  }
  m_stm = Color::White;
  m_castling = WK | WQ | BK | BQ;
  m_ep = NO_SQUARE;
}

Square Board::kingSquare(Color side) const {
  for (Square s = 0; s < 64; ++s) {
    const Piece& p = m_squares[s];
    if (p.type == PieceType::King && p.color == side) return s;
  }
  return NO_SQUARE;
}

bool Board::inCheck(Color side) const {
  const Square k = kingSquare(side);
  return k != NO_SQUARE && isAttacked(k, ~side);
}

bool Board::isAttacked(Square sq, Color by) const {
  const int f = file_of(sq);
  const int r = rank_of(sq);
  auto is = [&](Square s, PieceType t) {
    return s != NO_SQUARE && m_squares[s].type == t && m_squares[s].color == by;
  };

  // Pawns attack diagonally forward, so look one rank "behind" sq from the attacker's view.
  const int pr = (by == Color::White) ? r - 1 : r + 1;
  if (is(at(f - 1, pr), PieceType::Pawn) || is(at(f + 1, pr), PieceType::Pawn)) return true;

  for (const auto& d : KNIGHT_D)
    if (is(at(f + d[0], r + d[1]), PieceType::Knight)) return true;
  for (const auto& d : KING_D)
    if (is(at(f + d[0], r + d[1]), PieceType::King)) return true;

  auto slide = [&](const int (*dirs)[2], PieceType slider) {
    for (int i = 0; i < 4; ++i) {
      int cf = f + dirs[i][0], cr = r + dirs[i][1];
      for (Square s = at(cf, cr); s != NO_SQUARE; cf += dirs[i][0], cr += dirs[i][1], s = at(cf, cr)) {
        const Piece& p = m_squares[s];
        if (p.isNone()) continue;
        if (p.color == by && (p.type == slider || p.type == PieceType::Queen)) return true;
        break;
      }
    }
    return false;
  };
  return slide(DIAG_D, PieceType::Bishop) || slide(ORTHO_D, PieceType::Rook);
}

bool Board::castleLegal(Square from, Square to) const {
  const bool white = m_stm == Color::White;
  if (from != (white ? E1 : E8)) return false;

  const bool kingSide = file_of(to) > file_of(from);
  const std::uint8_t right = white ? (kingSide ? WK : WQ) : (kingSide ? BK : BQ);
  if (!(m_castling & right)) return false;

  const Square rookSq = white ? (kingSide ? H1 : A1) : (kingSide ? H8 : A8);
  const Piece rook = m_squares[rookSq];
  if (rook.type != PieceType::Rook || rook.color != m_stm) return false;

  const int step = kingSide ? 1 : -1;
  for (int cf = file_of(from) + step; cf != file_of(rookSq); cf += step)
    if (!m_squares[at(cf, rank_of(from))].isNone()) return false;

  // King may not castle out of, through, or into check.
  const Color them = ~m_stm;
  if (isAttacked(from, them)) return false;
  const Square through = white ? (kingSide ? F1 : D1) : (kingSide ? F8 : D8);
  return !isAttacked(through, them) && !isAttacked(to, them);
}

bool Board::pseudoLegal(Square from, Square to, PieceType promo) const {
  const Piece p = m_squares[from];
  if (p.isNone() || p.color != m_stm || from == to) return false;
  const Piece target = m_squares[to];
  if (!target.isNone() && target.color == m_stm) return false;

  const int df = file_of(to) - file_of(from);
  const int dr = rank_of(to) - rank_of(from);
  const int adf = std::abs(df), adr = std::abs(dr);

  if (p.type != PieceType::Pawn && promo != PieceType::None) return false;

  auto pathClear = [&](int sf, int sr) {
    int cf = file_of(from) + sf, cr = rank_of(from) + sr;
    for (; at(cf, cr) != to; cf += sf, cr += sr)
      if (!m_squares[at(cf, cr)].isNone()) return false;
    return true;
  };
  auto sign = [](int v) { return (v > 0) - (v < 0); };

  switch (p.type) {
    case PieceType::Pawn: {
      const int dir = (p.color == Color::White) ? 1 : -1;
      const int startRank = (p.color == Color::White) ? 1 : 6;
      const int lastRank = (p.color == Color::White) ? 7 : 0;

      bool ok = false;
      if (df == 0 && dr == dir) {
        ok = target.isNone();
      } else if (df == 0 && dr == 2 * dir && rank_of(from) == startRank) {
        ok = target.isNone() && m_squares[at(file_of(from), rank_of(from) + dir)].isNone();
      } else if (adf == 1 && dr == dir) {
        ok = !target.isNone() || (to == m_ep && m_ep != NO_SQUARE);
      }
      if (!ok) return false;

      if (rank_of(to) == lastRank)
        return promo == PieceType::Knight || promo == PieceType::Bishop ||
               promo == PieceType::Rook || promo == PieceType::Queen;
      return promo == PieceType::None;
    }
    case PieceType::Knight:
      return (adf == 1 && adr == 2) || (adf == 2 && adr == 1);
    case PieceType::Bishop:
      return adf == adr && pathClear(sign(df), sign(dr));
    case PieceType::Rook:
      return (df == 0 || dr == 0) && pathClear(sign(df), sign(dr));
    case PieceType::Queen:
      return (adf == adr || df == 0 || dr == 0) && pathClear(sign(df), sign(dr));
    case PieceType::King:
      if (adf <= 1 && adr <= 1) return true;
      if (adf == 2 && dr == 0) return castleLegal(from, to);
      return false;
    default:
      return false;
  }
}

void Board::applyUnchecked(Square from, Square to, PieceType promo) {
  Piece p = m_squares[from];
  const bool white = p.color == Color::White;

  if (p.type == PieceType::Pawn && to == m_ep && m_squares[to].isNone() &&
      file_of(from) != file_of(to)) {
    m_squares[at(file_of(to), rank_of(from))] = Piece{};
  }

  if (p.type == PieceType::King && std::abs(file_of(to) - file_of(from)) == 2) {
    const bool kingSide = file_of(to) > file_of(from);
    const Square rookFrom = white ? (kingSide ? H1 : A1) : (kingSide ? H8 : A8);
    const Square rookTo = white ? (kingSide ? F1 : D1) : (kingSide ? F8 : D8);
    m_squares[rookTo] = m_squares[rookFrom];
    m_squares[rookFrom] = Piece{};
  }

  m_ep = NO_SQUARE;
  if (p.type == PieceType::Pawn && std::abs(rank_of(to) - rank_of(from)) == 2)
    m_ep = at(file_of(from), (rank_of(from) + rank_of(to)) / 2);

  if (p.type == PieceType::Pawn && promo != PieceType::None) p.type = promo;
  m_squares[to] = p;
  m_squares[from] = Piece{};

  if (p.type == PieceType::King) m_castling &= white ? ~(WK | WQ) : ~(BK | BQ);
  for (Square s : {from, to}) {
    if (s == H1) m_castling &= ~WK;
    if (s == A1) m_castling &= ~WQ;
    if (s == H8) m_castling &= ~BK;
    if (s == A8) m_castling &= ~BQ;
  }

  m_stm = ~m_stm;
}

bool Board::doMoveUCI(const std::string& uciMove) {
  const std::size_t len = uciMove.size();
  if (len < 4 || len > 5) return false;

  const Square from = squareFromUCI(uciMove.c_str());
  const Square to = squareFromUCI(uciMove.c_str() + 2);
  if (from == NO_SQUARE || to == NO_SQUARE) return false;

  PieceType promo = PieceType::None;
  if (len == 5) {
    switch (uciMove[4]) {  // lowercase only
      case 'q': promo = PieceType::Queen; break;
      case 'r': promo = PieceType::Rook; break;
      case 'b': promo = PieceType::Bishop; break;
      case 'n': promo = PieceType::Knight; break;
      default: return false;
    }
  }

  if (!pseudoLegal(from, to, promo)) return false;

  Board next = *this;
  next.applyUnchecked(from, to, promo);
  if (next.inCheck(m_stm)) return false;
  *this = next;
  return true;
}

}  // namespace moveeval::model
