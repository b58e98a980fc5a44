#pragma once
#include <bootforge/workflow/action.hpp>

// Built-in workflow actions.
namespace bootforge::workflow::actions {

/// Read-only. Hash a whole disk; writes `<step>/disk.sha256.json`.
action_descriptor make_disk_hash_report();

/// Read-only. Verify an evidence bundle (or a tree of them).
action_descriptor make_report_verify();

/// Read-only on the source. Image a disk into a new file plus digest.
action_descriptor make_disk_image_and_stage();

/// Destructive. Write an image file to a disk and read it back.
action_descriptor make_apply_image();

/// Destructive. Raw-write a hybrid Linux installer ISO.
action_descriptor make_installer_usb_build_linux();

/// Destructive. Stage an extracted Windows installer onto a mounted volume.
action_descriptor make_installer_usb_build_windows();

/// Destructive. Stage a macOS installer tree onto a mounted volume.
action_descriptor make_installer_usb_build_macos();

/// Destructive. Stage an EFI bootloader package onto a mounted volume.
action_descriptor make_stage_bootloader();

}  // namespace bootforge::workflow::actions
