#include "model.h"

#include <iostream>
#include <map>
#include <set>

namespace {

enum class Distinctness { AlwaysDifferent, Needed, AlwaysEqual };

// build "a differs from b somewhere"; positions where both sides are the
// same constant can't help and are skipped
Distinctness differ(const std::vector<Term> &a, const std::vector<Term> &b,
                    DisjunctionConstraint &out) {
  out.anyOf.clear();
  for (size_t i = 0; i != a.size(); ++i) {
    if (!a[i].isVariable() && !b[i].isVariable()) {
      if (a[i].value != b[i].value) {
        return Distinctness::AlwaysDifferent;
      }
      continue;
    }
    out.anyOf.push_back(Inequality{a[i], b[i]});
  }
  return out.anyOf.empty() ? Distinctness::AlwaysEqual : Distinctness::Needed;
}

std::vector<Term> constantTerms(const std::string &word) {
  std::vector<Term> terms;
  for (char c : word) {
    terms.push_back(Term{-1, c - 'A'});
  }
  return terms;
}

std::string at(const SlotSignature &signature) {
  return "(" + std::to_string(signature.row) + "," +
         std::to_string(signature.col) + ") " +
         directionName(signature.direction);
}

} // namespace

std::string Model::wordFor(const ModelSlot &slot,
                           const std::vector<int> &values) const {
  std::string word;
  for (const Term &term : slot.terms) {
    const int value = term.isVariable() ? values[term.var] : term.value;
    word.push_back(static_cast<char>('A' + value));
  }
  return word;
}

std::vector<std::string> twoLetterCandidates(const Pattern &pattern) {
  std::vector<std::string> retval;
  if (pattern.size() != 2) {
    return retval;
  }
  auto choices = [](char c) {
    if (c >= 'A' && c <= 'Z') {
      return std::string(1, c);
    }
    return std::string("ABCDEFGHIJKLMNOPQRSTUVWXYZ");
  };
  for (char a : choices(pattern[0])) {
    for (char b : choices(pattern[1])) {
      retval.push_back(std::string{a, b});
    }
  }
  return retval;
}

std::vector<std::string>
ModelBuilder::candidatesFor(const Pattern &pattern, const WordSet &usedWords,
                            int &mediumSlots) const {
  const std::vector<const DictionaryEntry *> ranked = index.findCandidates(
      static_cast<int>(pattern.size()), pattern, usedWords, WordSet(),
      config.maxCandidates, config.fallbackFraction);

  std::vector<const DictionaryEntry *> kept;
  if (config.hasDifficultyCeiling) {
    for (const DictionaryEntry *entry : ranked) {
      if (entry->difficulty < config.maxDifficultyScore) {
        kept.push_back(entry);
      }
    }
    if (kept.empty() && !ranked.empty()) {
      // this slot keeps its full pool, if the budget allows
      ++mediumSlots;
      if (config.mediumSlotLimit < 0 || mediumSlots > config.mediumSlotLimit) {
        return std::vector<std::string>();
      }
      kept = ranked;
    }
  } else {
    kept = ranked;
  }

  std::vector<std::string> retval;
  retval.reserve(kept.size());
  for (const DictionaryEntry *entry : kept) {
    retval.push_back(entry->surface);
  }
  return retval;
}

bool ModelBuilder::build(const Grid &grid,
                         const std::vector<SlotSignature> &slots,
                         const WordSet &usedWords, Model &out,
                         std::string &reason) const {
  out = Model();
  std::map<Position, int> varByCell;
  int mediumSlots = 0;

  for (const SlotSignature &signature : slots) {
    ModelSlot slot;
    slot.signature = signature;
    if (!grid.findClueForStart(signature.row, signature.col,
                               signature.direction, slot.clueBox)) {
      reason = "unlicensed slot at " + at(signature);
      return false;
    }

    Pattern pattern;
    for (const Position &pos : signature.cells) {
      const Cell &cell = grid(pos.row, pos.col);
      if (cell.letter) {
        slot.terms.push_back(Term{-1, cell.letter - 'A'});
        pattern.push_back(cell.letter);
        continue;
      }
      pattern.push_back('.');
      auto it = varByCell.find(pos);
      if (it == varByCell.end()) {
        Variable variable;
        variable.name = "L_" + std::to_string(pos.row) + "_" +
                        std::to_string(pos.col);
        variable.cell = pos;
        it = varByCell.emplace(pos, static_cast<int>(out.variables.size()))
                 .first;
        out.variables.push_back(variable);
      }
      slot.terms.push_back(Term{it->second, 0});
    }

    const std::vector<std::string> candidates =
        signature.length() >= 3
            ? candidatesFor(pattern, usedWords, mediumSlots)
            : twoLetterCandidates(pattern);
    if (candidates.empty()) {
      reason = "no candidates for " + pattern + " at " + at(signature);
      return false;
    }
    slot.candidateCount = candidates.size();

    // the table only mentions the slot's variables; fixed letters are
    // already enforced by the pattern lookup
    TableConstraint table;
    std::vector<size_t> positions;
    for (size_t i = 0; i != slot.terms.size(); ++i) {
      if (slot.terms[i].isVariable()) {
        table.vars.push_back(slot.terms[i].var);
        positions.push_back(i);
      }
    }
    if (!table.vars.empty()) {
      std::set<std::vector<int>> seen;
      for (const std::string &word : candidates) {
        std::vector<int> tuple;
        for (size_t pos : positions) {
          tuple.push_back(word[pos] - 'A');
        }
        if (seen.insert(tuple).second) {
          table.tuples.push_back(tuple);
        }
      }
      out.tables.push_back(std::move(table));
    }
    out.slots.push_back(std::move(slot));
  }

  // same-length slots never get the same word
  for (size_t i = 0; i != out.slots.size(); ++i) {
    for (size_t j = i + 1; j != out.slots.size(); ++j) {
      const ModelSlot &a = out.slots[i];
      const ModelSlot &b = out.slots[j];
      if (a.terms.size() != b.terms.size()) {
        continue;
      }
      DisjunctionConstraint constraint;
      switch (differ(a.terms, b.terms, constraint)) {
      case Distinctness::AlwaysDifferent:
        break;
      case Distinctness::Needed:
        out.disjunctions.push_back(std::move(constraint));
        break;
      case Distinctness::AlwaysEqual:
        reason = "slots at " + at(a.signature) + " and " + at(b.signature) +
                 " are fixed to the same word";
        return false;
      }
    }
  }

  // nor a word that is already on the grid
  for (const ModelSlot &slot : out.slots) {
    for (const std::string &word : usedWords) {
      if (word.size() != slot.terms.size()) {
        continue;
      }
      DisjunctionConstraint constraint;
      switch (differ(slot.terms, constantTerms(word), constraint)) {
      case Distinctness::AlwaysDifferent:
        break;
      case Distinctness::Needed:
        out.disjunctions.push_back(std::move(constraint));
        break;
      case Distinctness::AlwaysEqual:
        reason = "slot at " + at(slot.signature) + " repeats " + word;
        return false;
      }
    }
  }

  if (config.verbosity >= 1) {
    std::cout << "model: " << out.slots.size() << " slots, "
              << out.variables.size() << " variables, " << out.tables.size()
              << " tables, " << out.disjunctions.size() << " disjunctions"
              << std::endl;
  }
  return true;
}

bool commitAssignment(LayoutEngine &engine, const Model &model,
                      const std::vector<int> &values, std::string &reason) {
  if (values.size() != model.variables.size()) {
    reason = "assignment does not cover the model";
    return false;
  }
  for (const ModelSlot &slot : model.slots) {
    if (!engine.commitSignature(slot.signature, model.wordFor(slot, values),
                                reason)) {
      return false;
    }
  }
  return true;
}
