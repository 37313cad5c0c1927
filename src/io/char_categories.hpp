#ifndef PARENS_IO_CHAR_CATEGORIES_HPP
#define PARENS_IO_CHAR_CATEGORIES_HPP

namespace parens {

inline bool
whitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline bool
digit(char c) {
  return c >= '0' && c <= '9';
}

// Characters that end a symbol, keyword or number run.
inline bool
delimiter(char c) {
  return whitespace(c)
         || c == '(' || c == ')' || c == '[' || c == ']'
         || c == '"' || c == ';' || c == '}' || c == '~'
    ;
}

// Characters that have no meaning anywhere outside of strings and comments.
inline bool
unsupported(char c) {
  return c == '#' || c == '$' || c == '%' || c == '^' || c == '&'
         || c == '\\' || c == ','
         || c == '{' || c == '`' || c == '\'' || c == '@'
         || (static_cast<unsigned char>(c) < 0x20 && !whitespace(c))
         || c == 0x7f;
}

}

#endif
