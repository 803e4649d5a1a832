// ---------------------------------------------------------------------------
// text_shield.cpp
//
// 단일 패스 상태 기계로 리터럴/주석 경계를 추적한다.
// drop_literals / drop_comments 플래그 조합으로 두 가지 제거 모드를 구현한다.
// ---------------------------------------------------------------------------

#include "parser/text_shield.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace {

// 백틱 식별자 치환값. 같은 내용이면 같은 이름을 돌려준다.
std::string backtick_placeholder(std::vector<std::string>& seen, std::string_view content) {
    for (std::size_t idx = 0; idx < seen.size(); ++idx) {
        if (seen[idx] == content) {
            return "`_bt" + std::to_string(idx) + "`";
        }
    }
    seen.emplace_back(content);
    return "`_bt" + std::to_string(seen.size() - 1) + "`";
}

// keep_length: 제거 대신 같은 길이의 공백/밑줄로 덮는다 (원문과 인덱스 정렬 유지).
ShieldedText scan(std::string_view in, bool drop_literals, bool drop_comments, bool keep_length) {
    ShieldedText out;
    out.text.reserve(in.size());

    std::vector<std::string> backticks;
    std::size_t i = 0;
    const std::size_t len = in.size();

    while (i < len) {
        const char ch = in[i];

        // 블록 주석 /* ... */
        if (ch == '/' && i + 1 < len && in[i + 1] == '*') {
            const std::size_t close = in.find("*/", i + 2);
            if (close == std::string_view::npos) {
                out.unterminated_comment = true;
                out.text.append(in.substr(i));
                break;
            }
            if (keep_length) {
                for (std::size_t k = i; k < close + 2; ++k) {
                    out.text.push_back(in[k] == '\n' ? '\n' : ' ');
                }
            } else if (drop_comments) {
                out.text.push_back(' ');
            } else {
                out.text.append(in.substr(i, close + 2 - i));
            }
            i = close + 2;
            continue;
        }

        // 라인 주석 // (개행은 보존)
        if (ch == '/' && i + 1 < len && in[i + 1] == '/') {
            std::size_t eol = in.find('\n', i);
            if (eol == std::string_view::npos) {
                eol = len;
            }
            if (keep_length) {
                out.text.append(eol - i, ' ');
            } else if (!drop_comments) {
                out.text.append(in.substr(i, eol - i));
            }
            i = eol;
            continue;
        }

        // 문자열 리터럴 '...' / "..."
        if (ch == '\'' || ch == '"') {
            std::size_t j = i + 1;
            bool closed = false;
            while (j < len) {
                if (in[j] == '\\') {
                    j += 2;
                    continue;
                }
                if (in[j] == ch) {
                    closed = true;
                    break;
                }
                ++j;
            }
            if (!closed) {
                out.unterminated_literal = true;
                out.text.append(in.substr(i));
                break;
            }
            if (keep_length) {
                out.text.push_back(ch);
                out.text.append(j - i - 1, ' ');
                out.text.push_back(ch);
            } else if (drop_literals) {
                out.text.push_back(ch);
                out.text.push_back(ch);
            } else {
                out.text.append(in.substr(i, j + 1 - i));
            }
            i = j + 1;
            continue;
        }

        // 백틱 식별자 `...` (`` 는 이스케이프된 백틱)
        if (ch == '`') {
            std::size_t j = i + 1;
            bool closed = false;
            while (j < len) {
                if (in[j] == '`') {
                    if (j + 1 < len && in[j + 1] == '`') {
                        j += 2;
                        continue;
                    }
                    closed = true;
                    break;
                }
                ++j;
            }
            if (!closed) {
                out.unterminated_literal = true;
                out.text.append(in.substr(i));
                break;
            }
            if (keep_length) {
                out.text.push_back('`');
                out.text.append(j - i - 1, '_');
                out.text.push_back('`');
            } else if (drop_literals) {
                out.text += backtick_placeholder(backticks, in.substr(i + 1, j - i - 1));
            } else {
                out.text.append(in.substr(i, j + 1 - i));
            }
            i = j + 1;
            continue;
        }

        out.text.push_back(ch);
        ++i;
    }

    return out;
}

}  // namespace

ShieldedText strip_string_literals(std::string_view query) {
    return scan(query, /*drop_literals=*/true, /*drop_comments=*/false, /*keep_length=*/false);
}

ShieldedText strip_comments(std::string_view text) {
    return scan(text, /*drop_literals=*/false, /*drop_comments=*/true, /*keep_length=*/false);
}

ShieldedText shield_query(std::string_view query) {
    ShieldedText literals = strip_string_literals(query);
    ShieldedText comments = strip_comments(literals.text);
    comments.unterminated_literal = comments.unterminated_literal || literals.unterminated_literal;
    comments.unterminated_comment = comments.unterminated_comment || literals.unterminated_comment;
    return comments;
}

ShieldedText mask_query(std::string_view query) {
    return scan(query, /*drop_literals=*/true, /*drop_comments=*/true, /*keep_length=*/true);
}
