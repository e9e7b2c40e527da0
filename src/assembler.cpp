#include "tablet/assembler.h"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

#include "tablet/errors.hpp"
#include "tablet/internal/memory.hpp"
#include "tablet/internal/vm.h"
#include "tablet/opcodes.hpp"

// Two passes over the source:
//  1) layout: bind labels to addresses, size every statement (macros included)
//  2) encode: resolve operands and expand macros at their own address
// Words are only handed to the caller once both passes succeeded.

namespace
{

using tablet::Macro;
using tablet::MacroEntry;
using tablet::Op;

enum class StmtKind : uint8_t
{
  Instruction,  // three-letter opcode name
  Macro,        // entry of macros.def
  Word,         // raw hex word (data or numeric opcode)
};

struct Statement
{
  int line;
  StmtKind kind;
  tb_u32 opcode;            // Instruction / Word
  const MacroEntry *macro;  // Macro
  std::vector<std::string> operands;
  tb_u32 addr;  // filled by pass 1
};

struct Encoded
{
  tb_u32 op, a, b, c;
};

/* ----------------------------- Lexing helpers ---------------------------- */

static inline bool is_blank(char ch)
{
  return ch == ' ' || ch == '\t';
}

static inline int hex_digit(char ch)
{
  if (ch >= '0' && ch <= '9')
    return ch - '0';
  if (ch >= 'a' && ch <= 'f')
    return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F')
    return ch - 'A' + 10;
  return -1;
}

static bool is_label_name(const std::string &s)
{
  if (s.empty())
    return false;
  for (char ch : s)
  {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.';
    if (!ok)
      return false;
  }
  return true;
}

static bool all_hex_digits(const std::string &s)
{
  if (s.empty())
    return false;
  for (char ch : s)
    if (hex_digit(ch) < 0)
      return false;
  return true;
}

// Parse an unsigned 32-bit hex number. Leading zeros are allowed.
static bool parse_hex32(const std::string &s, tb_u32 *out)
{
  if (!all_hex_digits(s))
    return false;
  uint64_t v = 0;
  for (char ch : s)
  {
    v = (v << 4) | static_cast<uint64_t>(hex_digit(ch));
    if (v > 0xFFFFFFFFull)
      return false;
  }
  *out = static_cast<tb_u32>(v);
  return true;
}

// Split on LF, VT, FF, CR, CR LF and the UTF-8 forms of NEL, LS and PS.
static std::vector<std::string> split_lines(const char *src, size_t len)
{
  std::vector<std::string> lines;
  std::string cur;
  size_t i = 0;
  while (i < len)
  {
    const unsigned char ch = static_cast<unsigned char>(src[i]);
    if (ch == '\n' || ch == '\v' || ch == '\f')
    {
      lines.push_back(cur);
      cur.clear();
      ++i;
    }
    else if (ch == '\r')
    {
      lines.push_back(cur);
      cur.clear();
      ++i;
      if (i < len && src[i] == '\n')
        ++i;
    }
    else if (ch == 0xC2 && i + 1 < len && static_cast<unsigned char>(src[i + 1]) == 0x85)
    {
      lines.push_back(cur);
      cur.clear();
      i += 2;
    }
    else if (ch == 0xE2 && i + 2 < len && static_cast<unsigned char>(src[i + 1]) == 0x80 &&
             (static_cast<unsigned char>(src[i + 2]) == 0xA8 ||
              static_cast<unsigned char>(src[i + 2]) == 0xA9))
    {
      lines.push_back(cur);
      cur.clear();
      i += 3;
    }
    else
    {
      cur.push_back(static_cast<char>(ch));
      ++i;
    }
  }
  if (!cur.empty())
    lines.push_back(cur);
  return lines;
}

static std::vector<std::string> split_tokens(const std::string &text)
{
  std::vector<std::string> tokens;
  size_t i = 0;
  while (i < text.size())
  {
    while (i < text.size() && is_blank(text[i]))
      ++i;
    size_t start = i;
    while (i < text.size() && !is_blank(text[i]))
      ++i;
    if (i > start)
      tokens.push_back(text.substr(start, i - start));
  }
  return tokens;
}

static const MacroEntry *find_macro(const std::string &name)
{
  for (const MacroEntry &m : tablet::kMacroTable)
    if (name == m.mnemonic)
      return &m;
  return nullptr;
}

static bool find_opcode(const std::string &name, tb_u32 *out)
{
  for (const tablet::OpcodeEntry &e : tablet::kOpcodeTable)
  {
    if (name == e.mnemonic)
    {
      *out = e.opcode;
      return true;
    }
  }
  return false;
}

static inline Encoded ins(Op op, tb_u32 a, tb_u32 b, tb_u32 c)
{
  return Encoded{static_cast<tb_u32>(op), a, b, c};
}

/* ------------------------------- Assembler ------------------------------- */

class Assembler
{
public:
  explicit Assembler(TbAsmDiag *diag) : diag_(diag) {}

  tb_err run(const char *src, size_t len)
  {
    if (tb_err e = parse(src, len))
      return e;
    if (tb_err e = layout())
      return e;
    return encode();
  }

  const std::vector<tb_u32> &image() const
  {
    return image_;
  }

private:
  tb_err fail(Err code, int line, const std::string &token, const char *fmt, ...)
  {
    if (diag_)
    {
      diag_->code = static_cast<tb_err>(code);
      diag_->line = line;
      snprintf(diag_->token, sizeof(diag_->token), "%s", token.c_str());

      char detail[TB_ASM_MESSAGE_MAX];
      va_list ap;
      va_start(ap, fmt);
      vsnprintf(detail, sizeof(detail), fmt, ap);
      va_end(ap);
      snprintf(diag_->message, sizeof(diag_->message), "line %d: %s", line, detail);
    }
    return static_cast<tb_err>(code);
  }

  // Strip comments, peel labels, classify mnemonics.
  tb_err parse(const char *src, size_t len)
  {
    const std::vector<std::string> lines = split_lines(src, len);
    for (size_t n = 0; n < lines.size(); ++n)
    {
      const int line_no = static_cast<int>(n) + 1;
      std::string text = lines[n];

      const size_t semi = text.find(';');
      if (semi != std::string::npos)
        text.erase(semi);

      std::vector<std::string> tokens = split_tokens(text);
      if (tokens.empty())
        continue;

      // "name:" opens the line; an instruction may follow on the same line.
      const size_t colon = tokens[0].find(':');
      if (colon != std::string::npos)
      {
        std::string name = tokens[0].substr(0, colon);
        std::string rest = tokens[0].substr(colon + 1);
        if (!is_label_name(name))
          return fail(Err::InvalidLabel, line_no, tokens[0], "invalid label name '%s'",
                      name.c_str());
        labels_order_.push_back(Pending{line_no, name, statements_.size()});

        tokens.erase(tokens.begin());
        if (!rest.empty())
          tokens.insert(tokens.begin(), rest);
        if (tokens.empty())
          continue;
      }

      Statement st;
      st.line = line_no;
      st.opcode = 0;
      st.macro = nullptr;
      st.addr = 0;

      const std::string &mnemonic = tokens[0];
      if (find_opcode(mnemonic, &st.opcode))
        st.kind = StmtKind::Instruction;
      else if ((st.macro = find_macro(mnemonic)) != nullptr)
        st.kind = StmtKind::Macro;
      else if (parse_hex32(mnemonic, &st.opcode))
        st.kind = StmtKind::Word;
      else
        return fail(Err::UnknownMnemonic, line_no, mnemonic, "unknown mnemonic '%s'",
                    mnemonic.c_str());

      st.operands.assign(tokens.begin() + 1, tokens.end());
      const size_t max_operands = st.macro ? st.macro->operands : 3u;
      if (st.operands.size() > max_operands)
        return fail(Err::TooManyOperands, line_no, st.operands[max_operands],
                    "'%s' takes at most %u operands", mnemonic.c_str(),
                    static_cast<unsigned>(max_operands));

      statements_.push_back(std::move(st));
    }
    return TB_ERR(OK);
  }

  // Pass 1: assign addresses and bind labels.
  tb_err layout()
  {
    tb_u32 addr = 0;
    std::vector<tb_u32> addr_of(statements_.size() + 1, 0);
    for (size_t i = 0; i < statements_.size(); ++i)
    {
      Statement &st = statements_[i];
      st.addr = addr;
      addr_of[i] = addr;
      const tb_u32 insns = st.macro ? st.macro->instructions : 1u;
      addr += 4u * insns;
    }
    addr_of[statements_.size()] = addr;

    // A label names the first statement after it.
    for (const Pending &p : labels_order_)
    {
      if (labels_.count(p.name))
        return fail(Err::DuplicateLabel, p.line, p.name, "label '%s' already defined",
                    p.name.c_str());
      labels_[p.name] = addr_of[p.next_statement];
    }
    return TB_ERR(OK);
  }

  tb_err resolve(const std::string &tok, tb_u32 base, int line, tb_u32 *out)
  {
    auto it = labels_.find(tok);
    if (it != labels_.end())
    {
      *out = it->second;
      return TB_ERR(OK);
    }

    // /n : n instructions (4n words) from the current statement
    if (tok[0] == '/')
    {
      tb_u32 n;
      if (!parse_hex32(tok.substr(1), &n))
        return fail(Err::MalformedOperand, line, tok, "bad relative offset '%s'",
                    tok.c_str());
      *out = base + 4u * n;
      return TB_ERR(OK);
    }

    if (parse_hex32(tok, out))
      return TB_ERR(OK);

    if (is_label_name(tok) && !all_hex_digits(tok))
      return fail(Err::UndefinedLabel, line, tok, "undefined label '%s'", tok.c_str());
    return fail(Err::MalformedOperand, line, tok, "malformed operand '%s'", tok.c_str());
  }

  // Pass 2: encode every statement into its words.
  tb_err encode()
  {
    for (const Statement &st : statements_)
    {
      tb_u32 v[3] = {0, 0, 0};
      for (size_t i = 0; i < st.operands.size(); ++i)
        if (tb_err e = resolve(st.operands[i], st.addr, st.line, &v[i]))
          return e;

      if (st.kind == StmtKind::Macro)
        expand(st.macro->macro, st.addr, v);
      else
        push(Encoded{st.opcode, v[0], v[1], v[2]});
    }
    return TB_ERR(OK);
  }

  void push(const Encoded &e)
  {
    image_.push_back(e.op);
    image_.push_back(e.a);
    image_.push_back(e.b);
    image_.push_back(e.c);
  }

  // k is the address of the first expanded instruction. The scratch cell of
  // the compare macros is operand A of the trailing NOP.
  void expand(Macro m, tb_u32 k, const tb_u32 v[3])
  {
    switch (m)
    {
      case Macro::JMP:  // jmp T
        push(ins(Op::LPC, k + 3u, 0, v[0]));
        break;

      case Macro::JEZ:  // jez T X
        push(ins(Op::BEQ, k + 3u, v[1], v[0]));
        break;

      case Macro::JEQ:  // jeq T X Y
        push(ins(Op::SUB, k + 9u, v[1], v[2]));
        push(ins(Op::BEQ, k + 7u, k + 9u, v[0]));
        push(ins(Op::NOP, 0, 0, 0));
        break;

      case Macro::JNE:  // jne T X Y
        push(ins(Op::SUB, k + 13u, v[1], v[2]));
        push(ins(Op::BEQ, k + 7u, k + 13u, k + 16u));
        push(ins(Op::LPC, k + 11u, 0, v[0]));
        push(ins(Op::NOP, 0, 0, 0));
        break;

      case Macro::JLT:  // jlt T X Y
        push(ins(Op::CMP, k + 13u, v[1], v[2]));
        push(ins(Op::BEQ, k + 7u, k + 13u, k + 16u));
        push(ins(Op::LPC, k + 11u, 0, v[0]));
        push(ins(Op::NOP, 0, 0, 0));
        break;

      case Macro::JGE:  // jge T X Y
        push(ins(Op::CMP, k + 9u, v[1], v[2]));
        push(ins(Op::BEQ, k + 7u, k + 9u, v[0]));
        push(ins(Op::NOP, 0, 0, 0));
        break;

      case Macro::SET:  // set D V
        push(ins(Op::LEA, v[0], k + 3u, v[1]));
        break;

      case Macro::CAL:  // cal T R
        push(ins(Op::LEA, v[1], k + 3u, k + 8u));
        push(ins(Op::LPC, k + 7u, 0, v[0]));
        break;
    }
  }

  struct Pending
  {
    int line;
    std::string name;
    size_t next_statement;
  };

  TbAsmDiag *diag_;
  std::vector<Statement> statements_;
  std::vector<Pending> labels_order_;
  std::unordered_map<std::string, tb_u32> labels_;
  std::vector<tb_u32> image_;
};

static tb_err write_to_vm(void *user, tb_u32 addr, tb_u32 word)
{
  return tb_mem_write_core(static_cast<Vm *>(user), addr, word);
}

}  // namespace

/* ------------------------------- Public API ------------------------------ */

extern "C" tb_err tb_asm_assemble(const char *src, size_t len, tb_asm_emit_fn emit,
                                  void *user, TbAsmDiag *diag)
{
  if (diag)
    ::memset(diag, 0, sizeof(*diag));
  if ((!src && len > 0) || !emit)
    return TB_ERR(InvalidArg);

  Assembler as(diag);
  if (tb_err e = as.run(src, len))
    return e;

  const std::vector<tb_u32> &image = as.image();
  for (size_t i = 0; i < image.size(); ++i)
  {
    if (tb_err e = emit(user, static_cast<tb_u32>(i), image[i]))
    {
      if (diag)
      {
        diag->code = e;
        snprintf(diag->message, sizeof(diag->message), "emit failed at %zx: %s", i,
                 err_str(static_cast<Err>(e)));
      }
      return e;
    }
  }

  if (diag)
    diag->words = static_cast<tb_u32>(image.size());
  return TB_ERR(OK);
}

extern "C" tb_err vm_load_source(struct Vm *vm, const char *src, size_t len,
                                 TbAsmDiag *diag)
{
  if (!vm)
    return TB_ERR(InvalidArg);

  tb_mem_release_core(vm);
  tb_err e = tb_asm_assemble(src, len, write_to_vm, vm, diag);
  if (e)
    tb_mem_release_core(vm);

  vm_reset(vm);
  vm->last_err = e;
  return e;
}
