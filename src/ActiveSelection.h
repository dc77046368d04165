#pragma once

#include <QVector>

#include "ConfigModel.h"

//
// ActiveSelection
// ---------------
// "Exactly one active member per non-empty sibling collection."
//
// Sibling collections:
//   - groups of a primary document
//   - profiles / identities of each group
//   - environments / keys of a client document
//
// MutationEngine::apply() runs normalize() after every command and then
// checks holds(). Individual commands never promote or clear flags by hand
// beyond setActive(); deletes simply remove the row and let normalize()
// promote the first remaining member.
//
// Adapters also call normalize() after parsing so that a hand-edited file
// with zero or several active rows still loads into a valid model.
//

namespace ActiveSelection {

template <typename T>
int activeCount(const QVector<T> &items)
{
    int n = 0;
    for (const auto &it : items)
        if (it.active) ++n;
    return n;
}

template <typename T>
int activeIndex(const QVector<T> &items)
{
    for (int i = 0; i < items.size(); ++i)
        if (items[i].active) return i;
    return -1;
}

// Makes items[index] the only active member.
template <typename T>
void setActive(QVector<T> &items, int index)
{
    for (int i = 0; i < items.size(); ++i)
        items[i].active = (i == index);
}

// Several active -> keep the first. None (and non-empty) -> first becomes active.
// Returns true when a flag changed.
template <typename T>
bool normalize(QVector<T> &items)
{
    if (items.isEmpty()) return false;

    const int first = activeIndex(items);
    if (first < 0) {
        items[0].active = true;
        return true;
    }
    if (activeCount(items) == 1) return false;

    setActive(items, first);
    return true;
}

template <typename T>
bool holds(const QVector<T> &items)
{
    return items.isEmpty() ? true : activeCount(items) == 1;
}

// Whole-document versions.
bool normalize(ConfigDocument &doc);
bool holds(const ConfigDocument &doc);

} // namespace ActiveSelection
