#pragma once

namespace btrsnap {

enum class LabelPlacement {
    Prefix,
    Postfix,
    Vfs
};

enum class DirectoryPlacement {
    Nested,
    Mirrored,
    Flat
};

enum class NameDelimiter {
    Colon,
    Dash
};

enum class StalenessMethod {
    ModificationTime,
    ChangeSequenceId
};

enum class ErrorKind {
    Config,
    InvalidVolume,
    DirectoryFailure,
    NameCollision,
    CreationFailure,
    DeletionFailure,
    BackendQueryFailure
};

} // namespace btrsnap
