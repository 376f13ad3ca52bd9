/**
 * @file dicom_tag_constants.hpp
 * @brief Tags the reader, frame splitter and codecs look up by name
 *
 * Only attributes dcmwire itself consults are listed; everything else is
 * reached through tag_dictionary.
 */

#pragma once

#include "dicom_tag.hpp"

namespace dcmwire::core::tags {

// ============================================================================
// File meta group, read before the transfer syntax is known
// ============================================================================

inline constexpr dicom_tag file_meta_information_group_length{0x0002, 0x0000};
inline constexpr dicom_tag file_meta_information_version{0x0002, 0x0001};
inline constexpr dicom_tag media_storage_sop_class_uid{0x0002, 0x0002};
inline constexpr dicom_tag media_storage_sop_instance_uid{0x0002, 0x0003};
/// Selects byte order, VR mode and pixel data encoding of the body
inline constexpr dicom_tag transfer_syntax_uid{0x0002, 0x0010};
inline constexpr dicom_tag implementation_class_uid{0x0002, 0x0012};
inline constexpr dicom_tag implementation_version_name{0x0002, 0x0013};

// ============================================================================
// Identification copied into the generated meta group
// ============================================================================

/// Value switches the text decoding context of the enclosing dataset
inline constexpr dicom_tag specific_character_set{0x0008, 0x0005};
inline constexpr dicom_tag sop_class_uid{0x0008, 0x0016};
inline constexpr dicom_tag sop_instance_uid{0x0008, 0x0018};
inline constexpr dicom_tag modality{0x0008, 0x0060};
inline constexpr dicom_tag referenced_image_sequence{0x0008, 0x1140};
inline constexpr dicom_tag patient_name{0x0010, 0x0010};
inline constexpr dicom_tag patient_id{0x0010, 0x0020};
inline constexpr dicom_tag study_instance_uid{0x0020, 0x000D};
inline constexpr dicom_tag series_instance_uid{0x0020, 0x000E};

// ============================================================================
// Pixel description consumed by the codecs
// ============================================================================

inline constexpr dicom_tag samples_per_pixel{0x0028, 0x0002};
inline constexpr dicom_tag photometric_interpretation{0x0028, 0x0004};
inline constexpr dicom_tag planar_configuration{0x0028, 0x0006};
/// Frame count for the fragment-to-frame split
inline constexpr dicom_tag number_of_frames{0x0028, 0x0008};
inline constexpr dicom_tag rows{0x0028, 0x0010};
inline constexpr dicom_tag columns{0x0028, 0x0011};
inline constexpr dicom_tag bits_allocated{0x0028, 0x0100};
inline constexpr dicom_tag bits_stored{0x0028, 0x0101};
inline constexpr dicom_tag high_bit{0x0028, 0x0102};
inline constexpr dicom_tag pixel_representation{0x0028, 0x0103};

// ============================================================================
// Pixel payload and its frame index
// ============================================================================

/// 64-bit frame offsets, used instead of the Basic Offset Table when present
inline constexpr dicom_tag extended_offset_table{0x7FE0, 0x0001};
inline constexpr dicom_tag extended_offset_table_lengths{0x7FE0, 0x0002};
inline constexpr dicom_tag float_pixel_data{0x7FE0, 0x0008};
inline constexpr dicom_tag double_float_pixel_data{0x7FE0, 0x0009};
inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

// ============================================================================
// Delimitation group FFFE, framing of items and fragments
// ============================================================================

inline constexpr dicom_tag item{0xFFFE, 0xE000};
inline constexpr dicom_tag item_delimitation_item{0xFFFE, 0xE00D};
inline constexpr dicom_tag sequence_delimitation_item{0xFFFE, 0xE0DD};

}  // namespace dcmwire::core::tags
