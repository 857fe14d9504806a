/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/forms/column_selection.hpp>
#include <raggedform/log/log.hpp>
#include <raggedform/util/configs_map.hpp>
#include <raggedform/util/glob.hpp>
#include <raggedform/util/preconditions.hpp>
#include <raggedform/util/variant.hpp>

#include <boost/algorithm/string.hpp>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace raggedform {

namespace {

struct Span {
    size_t start_;
    size_t stop_;
};

// Groups without nested braces, right to left so that replacing one leaves the offsets of the others valid
std::vector<Span> innermost_groups(std::string_view text) {
    std::vector<Span> out;
    auto open = std::string_view::npos;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '{') {
            open = i;
        } else if (text[i] == '}' && open != std::string_view::npos) {
            out.push_back({open, i + 1});
            open = std::string_view::npos;
        }
    }
    std::reverse(out.begin(), out.end());
    return out;
}

class BraceExpander {
  public:
    explicit BraceExpander(int64_t max_expansions) :
        max_expansions_(max_expansions) {
    }

    void expand(const std::string& text) {
        const auto spans = innermost_groups(text);
        if (spans.empty()) {
            if (seen_.insert(text).second) {
                user_input::check<ErrorCode::E_INVALID_COLUMN_SPECIFIER>(
                    static_cast<int64_t>(out_.size()) < max_expansions_,
                    "Column specifier expands into more than {} alternatives", max_expansions_);
                out_.push_back(text);
            }
            return;
        }

        std::vector<std::vector<std::string>> alternatives;
        int64_t combinations = 1;
        for (const auto& span : spans) {
            auto& alts = alternatives.emplace_back();
            const auto body = text.substr(span.start_ + 1, span.stop_ - span.start_ - 2);
            boost::split(alts, body, boost::is_any_of(","));
            combinations *= static_cast<int64_t>(alts.size());
            user_input::check<ErrorCode::E_INVALID_COLUMN_SPECIFIER>(
                combinations <= max_expansions_,
                "Column specifier '{}' expands into more than {} alternatives", text, max_expansions_);
        }

        // Odometer over the groups, the first (rightmost) group varying slowest
        std::vector<size_t> choice(spans.size(), 0);
        while (true) {
            std::string replaced = text;
            for (size_t i = 0; i < spans.size(); ++i)
                replaced.replace(spans[i].start_, spans[i].stop_ - spans[i].start_, alternatives[i][choice[i]]);

            expand(replaced);

            size_t digit = spans.size();
            while (digit > 0) {
                --digit;
                if (++choice[digit] < alternatives[digit].size())
                    break;

                choice[digit] = 0;
                if (digit == 0)
                    return;
            }
        }
    }

    std::vector<std::string> release() {
        return std::move(out_);
    }

  private:
    int64_t max_expansions_;
    std::unordered_set<std::string> seen_;
    std::vector<std::string> out_;
};

void collect_columns(
    const Form& form,
    std::vector<std::string>& path,
    std::vector<std::string>& output,
    const std::optional<std::string>& list_indicator) {
    const auto add_list_dimension = [&](const FormPtr& content) {
        if (list_indicator) {
            path.push_back(*list_indicator);
            collect_columns(*content, path, output, list_indicator);
            path.pop_back();
        } else {
            collect_columns(*content, path, output, list_indicator);
        }
    };

    util::variant_match(form.node(),
        [&](const NumpyForm& numpy) {
            const auto depth = path.size();
            if (list_indicator)
                path.insert(path.end(), numpy.inner_shape_.size(), *list_indicator);

            output.push_back(boost::algorithm::join(path, "."));
            path.resize(depth);
        },
        [&](const EmptyForm&) {
            output.push_back(boost::algorithm::join(path, "."));
        },
        [&](const RegularForm& regular) {
            add_list_dimension(regular.content_);
        },
        [&](const ListForm& list) {
            add_list_dimension(list.content_);
        },
        [&](const ListOffsetForm& list_offset) {
            add_list_dimension(list_offset.content_);
        },
        [&](const RecordForm& record) {
            const auto fields = form.fields();
            for (size_t i = 0; i < record.contents_.size(); ++i) {
                path.push_back(fields[i]);
                collect_columns(*record.contents_[i], path, output, list_indicator);
                path.pop_back();
            }
        },
        [&](const UnionForm& union_form) {
            for (const auto& content : union_form.contents_)
                collect_columns(*content, path, output, list_indicator);
        },
        [&](const auto&) {
            collect_columns(*form.content(), path, output, list_indicator);
        }
    );
}

void collect_column_types(const Form& form, std::vector<types::TypePtr>& output) {
    if (form.is_numpy() || form.is_unknown()) {
        output.push_back(form.type());
        return;
    }
    if (form.is_record() || form.is_union()) {
        for (const auto& content : form.contents())
            collect_column_types(*content, output);
        return;
    }
    collect_column_types(*form.content(), output);
}

bool segment_matches(const std::string& field, const std::string& pattern) {
    if (!util::has_glob_characters(pattern))
        return field == pattern;

    return util::glob_match_case(field, pattern);
}

/*
 * The active subset of specifiers narrows at every record level. `leaves` counts the leaves kept so
 * far, so a subtree is known to have contributed when the count moves.
 */
class ColumnSelector {
  public:
    explicit ColumnSelector(std::vector<std::vector<std::string>> specifiers) :
        specifiers_(std::move(specifiers)) {
    }

    FormPtr select(const FormPtr& form, size_t index, const std::vector<bool>& matches) {
        return util::variant_match(form->node(),
            [&](const NumpyForm&) -> FormPtr {
                return select_leaf(form, index, matches);
            },
            [&](const EmptyForm&) -> FormPtr {
                return select_leaf(form, index, matches);
            },
            [&](const RecordForm& record) -> FormPtr {
                return select_record(*form, record, index, matches);
            },
            [&](const UnionForm& union_form) -> FormPtr {
                std::vector<FormPtr> contents;
                contents.reserve(union_form.contents_.size());
                for (const auto& content : union_form.contents_)
                    contents.push_back(select(content, index, matches));

                return form->copy(FormCopy{.contents_ = std::move(contents)});
            },
            [&](const auto&) -> FormPtr {
                return form->copy(FormCopy{.content_ = select(form->content(), index, matches)});
            }
        );
    }

  private:
    // A leaf only counts when some specifier ends at or above it
    FormPtr select_leaf(const FormPtr& form, size_t index, const std::vector<bool>& matches) {
        for (size_t s = 0; s < specifiers_.size(); ++s) {
            if (matches[s] && index >= specifiers_[s].size()) {
                ++leaves_;
                break;
            }
        }
        return form;
    }

    FormPtr select_record(const Form& form, const RecordForm& record, size_t index, const std::vector<bool>& matches) {
        const auto fields = form.fields();
        std::vector<FormPtr> contents;
        std::vector<std::string> kept_fields;
        for (size_t i = 0; i < record.contents_.size(); ++i) {
            std::vector<bool> next_matches(specifiers_.size(), false);
            for (size_t s = 0; s < specifiers_.size(); ++s) {
                const auto& item = specifiers_[s];
                next_matches[s] = matches[s] && (index >= item.size() || segment_matches(fields[i], item[index]));
            }
            if (std::none_of(next_matches.begin(), next_matches.end(), [](bool matched) { return matched; }))
                continue;

            const auto before = leaves_;
            auto next_content = select(record.contents_[i], index + 1, next_matches);
            if (before != leaves_) {
                contents.push_back(std::move(next_content));
                kept_fields.push_back(fields[i]);
            } else {
                RAGGEDFORM_DEBUG(log::columns(), "Dropping field '{}' which selects no leaves", fields[i]);
            }
        }

        if (form.is_tuple() && contents.size() == record.contents_.size())
            return form.copy(FormCopy{.contents_ = std::move(contents)});

        return form.copy(FormCopy{.contents_ = std::move(contents), .fields_ = std::make_optional(std::move(kept_fields))});
    }

    std::vector<std::vector<std::string>> specifiers_;
    size_t leaves_ = 0;
};

std::vector<std::string> split_path(const std::string& specifier) {
    std::vector<std::string> out;
    if (specifier.empty())
        return out;

    boost::split(out, specifier, boost::is_any_of("."));
    return out;
}

} // namespace

std::vector<std::string> expand_braces(std::string_view text) {
    const auto max_expansions = ConfigsMap::instance()->get_int("Columns.MaxBraceExpansions", 4096);
    BraceExpander expander{max_expansions};
    expander.expand(std::string{text});
    return expander.release();
}

std::vector<std::string> columns(
    const Form& form,
    const std::optional<std::string>& list_indicator,
    const std::vector<std::string>& column_prefix) {
    std::vector<std::string> output;
    auto path = column_prefix;
    collect_columns(form, path, output, list_indicator);
    return output;
}

std::vector<types::TypePtr> column_types(const Form& form) {
    std::vector<types::TypePtr> output;
    collect_column_types(form, output);
    return output;
}

FormPtr select_columns(
    const FormPtr& form,
    const std::vector<std::string>& specifiers,
    bool expand_braces,
    bool prune_unions_and_records) {
    util::check_arg(static_cast<bool>(form), "select_columns requires a Form, got null");

    std::vector<std::string> expanded;
    if (expand_braces) {
        for (const auto& specifier : specifiers) {
            auto alternatives = raggedform::expand_braces(specifier);
            expanded.insert(expanded.end(), std::make_move_iterator(alternatives.begin()), std::make_move_iterator(alternatives.end()));
        }
    } else {
        expanded = specifiers;
    }

    // Duplicates are removed, order is irrelevant to matching
    std::sort(expanded.begin(), expanded.end());
    expanded.erase(std::unique(expanded.begin(), expanded.end()), expanded.end());
    RAGGEDFORM_DEBUG(log::columns(), "Selecting columns matching [{}]", fmt::join(expanded, ", "));

    std::vector<std::vector<std::string>> paths;
    paths.reserve(expanded.size());
    for (const auto& specifier : expanded)
        paths.push_back(split_path(specifier));

    const std::vector<bool> matches(paths.size(), true);
    ColumnSelector selector{std::move(paths)};
    auto selected = selector.select(form, 0, matches);
    if (!prune_unions_and_records)
        return selected;

    return prune_columns(selected, false);
}

FormPtr select_columns(
    const FormPtr& form,
    const std::string& specifier,
    bool expand_braces,
    bool prune_unions_and_records) {
    return select_columns(form, std::vector<std::string>{specifier}, expand_braces, prune_unions_and_records);
}

FormPtr prune_columns(const FormPtr& form, bool is_inside_record_or_union) {
    util::check_arg(static_cast<bool>(form), "prune_columns requires a Form, got null");
    return util::variant_match(form->node(),
        [&form](const NumpyForm&) -> FormPtr {
            return form;
        },
        [&form](const EmptyForm&) -> FormPtr {
            return form;
        },
        [&](const RecordForm& record) -> FormPtr {
            const auto fields = form->fields();
            std::vector<FormPtr> contents;
            std::vector<std::string> kept_fields;
            for (size_t i = 0; i < record.contents_.size(); ++i) {
                auto next_content = prune_columns(record.contents_[i], true);
                if (!next_content)
                    continue;

                contents.push_back(std::move(next_content));
                kept_fields.push_back(fields[i]);
            }
            if (is_inside_record_or_union && contents.empty())
                return nullptr;

            if (form->is_tuple() && contents.size() == record.contents_.size())
                return form->copy(FormCopy{.contents_ = std::move(contents)});

            return form->copy(FormCopy{.contents_ = std::move(contents), .fields_ = std::make_optional(std::move(kept_fields))});
        },
        [&](const UnionForm& union_form) -> FormPtr {
            std::vector<FormPtr> contents;
            for (const auto& content : union_form.contents_) {
                if (auto next_content = prune_columns(content, true))
                    contents.push_back(std::move(next_content));
            }
            if (contents.empty()) {
                if (is_inside_record_or_union)
                    return nullptr;

                return make_empty_form(FormMeta{form->parameters(), std::nullopt});
            }
            if (contents.size() == 1)
                return contents.front();

            return form->copy(FormCopy{.contents_ = std::move(contents)});
        },
        [&](const auto&) -> FormPtr {
            auto next_content = prune_columns(form->content(), is_inside_record_or_union);
            if (!next_content)
                return nullptr;

            return form->copy(FormCopy{.content_ = std::move(next_content)});
        }
    );
}

} // namespace raggedform
