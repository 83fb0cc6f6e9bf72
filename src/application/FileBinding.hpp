/**
 * @file FileBinding.hpp
 * @brief Type-level declaration of where and how a type is stored.
 *
 * A type opts in by specializing FileBinding once:
 *
 * @code
 * namespace stowage::application {
 * template <>
 * struct FileBinding<Settings> {
 *     using Codec = infrastructure::codecs::JsonCodec;
 *     static domain::Binding binding() {
 *         return {domain::DirectoryKind::Config, "MyProject", "", "settings"};
 *     }
 * };
 * }
 *
 * stowage::application::save(settings);
 * auto settings = stowage::application::load<Settings>();
 * @endcode
 *
 * A second specialization for the same type does not compile.
 */

#pragma once

#include "application/Persistent.hpp"
#include "domain/Metadata.hpp"

namespace stowage::application {

/// Specialized once per stored type; see the file comment.
template <typename T>
struct FileBinding;

template <typename T>
using PersistentFor = Persistent<T, typename FileBinding<T>::Codec>;

template <typename T>
PersistentFor<T> persistentFor() {
    return PersistentFor<T>(FileBinding<T>::binding());
}

template <typename T>
domain::Metadata save(const T& value) {
    return persistentFor<T>().save(value);
}

template <typename T>
T load() {
    return persistentFor<T>().load();
}

} // namespace stowage::application
