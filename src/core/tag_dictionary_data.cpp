/**
 * @file tag_dictionary_data.cpp
 * @brief Attribute table backing tag_dictionary
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#include "dcmwire/core/tag_dictionary.hpp"

#include <array>
#include <span>

namespace dcmwire::core {

using VR = dcmwire::encoding::vr_type;

// clang-format off
static constexpr std::array dictionary_entries = {
    // Group 0002 - File Meta Information
    tag_info{dicom_tag{0x0002, 0x0000}, VR::UL, "FileMetaInformationGroupLength", "File Meta Information Group Length"},
    tag_info{dicom_tag{0x0002, 0x0001}, VR::OB, "FileMetaInformationVersion", "File Meta Information Version"},
    tag_info{dicom_tag{0x0002, 0x0002}, VR::UI, "MediaStorageSOPClassUID", "Media Storage SOP Class UID"},
    tag_info{dicom_tag{0x0002, 0x0003}, VR::UI, "MediaStorageSOPInstanceUID", "Media Storage SOP Instance UID"},
    tag_info{dicom_tag{0x0002, 0x0010}, VR::UI, "TransferSyntaxUID", "Transfer Syntax UID"},
    tag_info{dicom_tag{0x0002, 0x0012}, VR::UI, "ImplementationClassUID", "Implementation Class UID"},
    tag_info{dicom_tag{0x0002, 0x0013}, VR::SH, "ImplementationVersionName", "Implementation Version Name"},
    tag_info{dicom_tag{0x0002, 0x0016}, VR::AE, "SourceApplicationEntityTitle", "Source Application Entity Title"},
    tag_info{dicom_tag{0x0002, 0x0017}, VR::AE, "SendingApplicationEntityTitle", "Sending Application Entity Title"},
    tag_info{dicom_tag{0x0002, 0x0018}, VR::AE, "ReceivingApplicationEntityTitle", "Receiving Application Entity Title"},
    tag_info{dicom_tag{0x0002, 0x0100}, VR::UI, "PrivateInformationCreatorUID", "Private Information Creator UID"},
    tag_info{dicom_tag{0x0002, 0x0102}, VR::OB, "PrivateInformation", "Private Information"},

    // Group 0008 - Identifying
    tag_info{dicom_tag{0x0008, 0x0005}, VR::CS, "SpecificCharacterSet", "Specific Character Set"},
    tag_info{dicom_tag{0x0008, 0x0006}, VR::SQ, "LanguageCodeSequence", "Language Code Sequence"},
    tag_info{dicom_tag{0x0008, 0x0008}, VR::CS, "ImageType", "Image Type"},
    tag_info{dicom_tag{0x0008, 0x0012}, VR::DA, "InstanceCreationDate", "Instance Creation Date"},
    tag_info{dicom_tag{0x0008, 0x0013}, VR::TM, "InstanceCreationTime", "Instance Creation Time"},
    tag_info{dicom_tag{0x0008, 0x0014}, VR::UI, "InstanceCreatorUID", "Instance Creator UID"},
    tag_info{dicom_tag{0x0008, 0x0016}, VR::UI, "SOPClassUID", "SOP Class UID"},
    tag_info{dicom_tag{0x0008, 0x0018}, VR::UI, "SOPInstanceUID", "SOP Instance UID"},
    tag_info{dicom_tag{0x0008, 0x001A}, VR::UI, "RelatedGeneralSOPClassUID", "Related General SOP Class UID"},
    tag_info{dicom_tag{0x0008, 0x001B}, VR::UI, "OriginalSpecializedSOPClassUID", "Original Specialized SOP Class UID"},
    tag_info{dicom_tag{0x0008, 0x0020}, VR::DA, "StudyDate", "Study Date"},
    tag_info{dicom_tag{0x0008, 0x0021}, VR::DA, "SeriesDate", "Series Date"},
    tag_info{dicom_tag{0x0008, 0x0022}, VR::DA, "AcquisitionDate", "Acquisition Date"},
    tag_info{dicom_tag{0x0008, 0x0023}, VR::DA, "ContentDate", "Content Date"},
    tag_info{dicom_tag{0x0008, 0x0030}, VR::TM, "StudyTime", "Study Time"},
    tag_info{dicom_tag{0x0008, 0x0031}, VR::TM, "SeriesTime", "Series Time"},
    tag_info{dicom_tag{0x0008, 0x0032}, VR::TM, "AcquisitionTime", "Acquisition Time"},
    tag_info{dicom_tag{0x0008, 0x0033}, VR::TM, "ContentTime", "Content Time"},
    tag_info{dicom_tag{0x0008, 0x0050}, VR::SH, "AccessionNumber", "Accession Number"},
    tag_info{dicom_tag{0x0008, 0x0052}, VR::CS, "QueryRetrieveLevel", "Query/Retrieve Level"},
    tag_info{dicom_tag{0x0008, 0x0054}, VR::AE, "RetrieveAETitle", "Retrieve AE Title"},
    tag_info{dicom_tag{0x0008, 0x0056}, VR::CS, "InstanceAvailability", "Instance Availability"},
    tag_info{dicom_tag{0x0008, 0x0058}, VR::UI, "FailedSOPInstanceUIDList", "Failed SOP Instance UID List"},
    tag_info{dicom_tag{0x0008, 0x0060}, VR::CS, "Modality", "Modality"},
    tag_info{dicom_tag{0x0008, 0x0061}, VR::CS, "ModalitiesInStudy", "Modalities in Study"},
    tag_info{dicom_tag{0x0008, 0x0062}, VR::UI, "SOPClassesInStudy", "SOP Classes in Study"},
    tag_info{dicom_tag{0x0008, 0x0064}, VR::CS, "ConversionType", "Conversion Type"},
    tag_info{dicom_tag{0x0008, 0x0068}, VR::CS, "PresentationIntentType", "Presentation Intent Type"},
    tag_info{dicom_tag{0x0008, 0x0070}, VR::LO, "Manufacturer", "Manufacturer"},
    tag_info{dicom_tag{0x0008, 0x0080}, VR::LO, "InstitutionName", "Institution Name"},
    tag_info{dicom_tag{0x0008, 0x0081}, VR::ST, "InstitutionAddress", "Institution Address"},
    tag_info{dicom_tag{0x0008, 0x0082}, VR::SQ, "InstitutionCodeSequence", "Institution Code Sequence"},
    tag_info{dicom_tag{0x0008, 0x0090}, VR::PN, "ReferringPhysicianName", "Referring Physician's Name"},
    tag_info{dicom_tag{0x0008, 0x0092}, VR::ST, "ReferringPhysicianAddress", "Referring Physician's Address"},
    tag_info{dicom_tag{0x0008, 0x0094}, VR::SH, "ReferringPhysicianTelephoneNumbers", "Referring Physician's Telephone Numbers"},
    tag_info{dicom_tag{0x0008, 0x0096}, VR::SQ, "ReferringPhysicianIdentificationSequence", "Referring Physician Identification Sequence"},
    tag_info{dicom_tag{0x0008, 0x0100}, VR::SH, "CodeValue", "Code Value"},
    tag_info{dicom_tag{0x0008, 0x0102}, VR::SH, "CodingSchemeDesignator", "Coding Scheme Designator"},
    tag_info{dicom_tag{0x0008, 0x0103}, VR::SH, "CodingSchemeVersion", "Coding Scheme Version"},
    tag_info{dicom_tag{0x0008, 0x0104}, VR::LO, "CodeMeaning", "Code Meaning"},
    tag_info{dicom_tag{0x0008, 0x0105}, VR::CS, "MappingResource", "Mapping Resource"},
    tag_info{dicom_tag{0x0008, 0x0106}, VR::DT, "ContextGroupVersion", "Context Group Version"},
    tag_info{dicom_tag{0x0008, 0x010F}, VR::CS, "ContextIdentifier", "Context Identifier"},
    tag_info{dicom_tag{0x0008, 0x0110}, VR::SQ, "CodingSchemeIdentificationSequence", "Coding Scheme Identification Sequence"},
    tag_info{dicom_tag{0x0008, 0x1010}, VR::SH, "StationName", "Station Name"},
    tag_info{dicom_tag{0x0008, 0x1030}, VR::LO, "StudyDescription", "Study Description"},
    tag_info{dicom_tag{0x0008, 0x103E}, VR::LO, "SeriesDescription", "Series Description"},
    tag_info{dicom_tag{0x0008, 0x1040}, VR::LO, "InstitutionalDepartmentName", "Institutional Department Name"},
    tag_info{dicom_tag{0x0008, 0x1048}, VR::PN, "PhysiciansOfRecord", "Physician(s) of Record"},
    tag_info{dicom_tag{0x0008, 0x1050}, VR::PN, "PerformingPhysicianName", "Performing Physician's Name"},
    tag_info{dicom_tag{0x0008, 0x1060}, VR::PN, "NameOfPhysiciansReadingStudy", "Name of Physician(s) Reading Study"},
    tag_info{dicom_tag{0x0008, 0x1070}, VR::PN, "OperatorsName", "Operators' Name"},
    tag_info{dicom_tag{0x0008, 0x1080}, VR::LO, "AdmittingDiagnosesDescription", "Admitting Diagnoses Description"},
    tag_info{dicom_tag{0x0008, 0x1084}, VR::SQ, "AdmittingDiagnosesCodeSequence", "Admitting Diagnoses Code Sequence"},
    tag_info{dicom_tag{0x0008, 0x1090}, VR::LO, "ManufacturerModelName", "Manufacturer's Model Name"},
    tag_info{dicom_tag{0x0008, 0x1110}, VR::SQ, "ReferencedStudySequence", "Referenced Study Sequence"},
    tag_info{dicom_tag{0x0008, 0x1111}, VR::SQ, "ReferencedPerformedProcedureStepSequence", "Referenced Performed Procedure Step Sequence"},
    tag_info{dicom_tag{0x0008, 0x1115}, VR::SQ, "ReferencedSeriesSequence", "Referenced Series Sequence"},
    tag_info{dicom_tag{0x0008, 0x1120}, VR::SQ, "ReferencedPatientSequence", "Referenced Patient Sequence"},
    tag_info{dicom_tag{0x0008, 0x1125}, VR::SQ, "ReferencedVisitSequence", "Referenced Visit Sequence"},
    tag_info{dicom_tag{0x0008, 0x1140}, VR::SQ, "ReferencedImageSequence", "Referenced Image Sequence"},
    tag_info{dicom_tag{0x0008, 0x1150}, VR::UI, "ReferencedSOPClassUID", "Referenced SOP Class UID"},
    tag_info{dicom_tag{0x0008, 0x1155}, VR::UI, "ReferencedSOPInstanceUID", "Referenced SOP Instance UID"},
    tag_info{dicom_tag{0x0008, 0x2111}, VR::ST, "DerivationDescription", "Derivation Description"},
    tag_info{dicom_tag{0x0008, 0x2112}, VR::SQ, "SourceImageSequence", "Source Image Sequence"},

    // Group 0010 - Patient
    tag_info{dicom_tag{0x0010, 0x0010}, VR::PN, "PatientName", "Patient's Name"},
    tag_info{dicom_tag{0x0010, 0x0020}, VR::LO, "PatientID", "Patient ID"},
    tag_info{dicom_tag{0x0010, 0x0021}, VR::LO, "IssuerOfPatientID", "Issuer of Patient ID"},
    tag_info{dicom_tag{0x0010, 0x0022}, VR::CS, "TypeOfPatientID", "Type of Patient ID"},
    tag_info{dicom_tag{0x0010, 0x0024}, VR::SQ, "IssuerOfPatientIDQualifiersSequence", "Issuer of Patient ID Qualifiers Sequence"},
    tag_info{dicom_tag{0x0010, 0x0030}, VR::DA, "PatientBirthDate", "Patient's Birth Date"},
    tag_info{dicom_tag{0x0010, 0x0032}, VR::TM, "PatientBirthTime", "Patient's Birth Time"},
    tag_info{dicom_tag{0x0010, 0x0040}, VR::CS, "PatientSex", "Patient's Sex"},
    tag_info{dicom_tag{0x0010, 0x0050}, VR::SQ, "PatientInsurancePlanCodeSequence", "Patient's Insurance Plan Code Sequence"},
    tag_info{dicom_tag{0x0010, 0x0101}, VR::SQ, "PatientPrimaryLanguageCodeSequence", "Patient's Primary Language Code Sequence"},
    tag_info{dicom_tag{0x0010, 0x0102}, VR::SQ, "PatientPrimaryLanguageModifierCodeSequence", "Patient's Primary Language Modifier Code Sequence"},
    tag_info{dicom_tag{0x0010, 0x1001}, VR::PN, "OtherPatientNames", "Other Patient Names"},
    tag_info{dicom_tag{0x0010, 0x1002}, VR::SQ, "OtherPatientIDsSequence", "Other Patient IDs Sequence"},
    tag_info{dicom_tag{0x0010, 0x1005}, VR::PN, "PatientBirthName", "Patient's Birth Name"},
    tag_info{dicom_tag{0x0010, 0x1010}, VR::AS, "PatientAge", "Patient's Age"},
    tag_info{dicom_tag{0x0010, 0x1020}, VR::DS, "PatientSize", "Patient's Size"},
    tag_info{dicom_tag{0x0010, 0x1030}, VR::DS, "PatientWeight", "Patient's Weight"},
    tag_info{dicom_tag{0x0010, 0x1040}, VR::LO, "PatientAddress", "Patient's Address"},
    tag_info{dicom_tag{0x0010, 0x2000}, VR::LO, "MedicalAlerts", "Medical Alerts"},
    tag_info{dicom_tag{0x0010, 0x2110}, VR::LO, "Allergies", "Allergies"},
    tag_info{dicom_tag{0x0010, 0x2150}, VR::LO, "CountryOfResidence", "Country of Residence"},
    tag_info{dicom_tag{0x0010, 0x2152}, VR::LO, "RegionOfResidence", "Region of Residence"},
    tag_info{dicom_tag{0x0010, 0x2154}, VR::SH, "PatientTelephoneNumbers", "Patient's Telephone Numbers"},
    tag_info{dicom_tag{0x0010, 0x2160}, VR::SH, "EthnicGroup", "Ethnic Group"},
    tag_info{dicom_tag{0x0010, 0x2180}, VR::SH, "Occupation", "Occupation"},
    tag_info{dicom_tag{0x0010, 0x21A0}, VR::CS, "SmokingStatus", "Smoking Status"},
    tag_info{dicom_tag{0x0010, 0x21B0}, VR::LT, "AdditionalPatientHistory", "Additional Patient History"},
    tag_info{dicom_tag{0x0010, 0x21C0}, VR::US, "PregnancyStatus", "Pregnancy Status"},
    tag_info{dicom_tag{0x0010, 0x21D0}, VR::DA, "LastMenstrualDate", "Last Menstrual Date"},
    tag_info{dicom_tag{0x0010, 0x21F0}, VR::LO, "PatientReligiousPreference", "Patient's Religious Preference"},
    tag_info{dicom_tag{0x0010, 0x4000}, VR::LT, "PatientComments", "Patient Comments"},

    // Group 0020 - Relationship
    tag_info{dicom_tag{0x0020, 0x000D}, VR::UI, "StudyInstanceUID", "Study Instance UID"},
    tag_info{dicom_tag{0x0020, 0x000E}, VR::UI, "SeriesInstanceUID", "Series Instance UID"},
    tag_info{dicom_tag{0x0020, 0x0010}, VR::SH, "StudyID", "Study ID"},
    tag_info{dicom_tag{0x0020, 0x0011}, VR::IS, "SeriesNumber", "Series Number"},
    tag_info{dicom_tag{0x0020, 0x0012}, VR::IS, "AcquisitionNumber", "Acquisition Number"},
    tag_info{dicom_tag{0x0020, 0x0013}, VR::IS, "InstanceNumber", "Instance Number"},
    tag_info{dicom_tag{0x0020, 0x0020}, VR::CS, "PatientOrientation", "Patient Orientation"},
    tag_info{dicom_tag{0x0020, 0x0032}, VR::DS, "ImagePositionPatient", "Image Position (Patient)"},
    tag_info{dicom_tag{0x0020, 0x0037}, VR::DS, "ImageOrientationPatient", "Image Orientation (Patient)"},
    tag_info{dicom_tag{0x0020, 0x0052}, VR::UI, "FrameOfReferenceUID", "Frame of Reference UID"},
    tag_info{dicom_tag{0x0020, 0x0060}, VR::CS, "Laterality", "Laterality"},
    tag_info{dicom_tag{0x0020, 0x0062}, VR::CS, "ImageLaterality", "Image Laterality"},
    tag_info{dicom_tag{0x0020, 0x0100}, VR::IS, "TemporalPositionIdentifier", "Temporal Position Identifier"},
    tag_info{dicom_tag{0x0020, 0x0105}, VR::IS, "NumberOfTemporalPositions", "Number of Temporal Positions"},
    tag_info{dicom_tag{0x0020, 0x0110}, VR::DS, "TemporalResolution", "Temporal Resolution"},
    tag_info{dicom_tag{0x0020, 0x0200}, VR::UI, "SynchronizationFrameOfReferenceUID", "Synchronization Frame of Reference UID"},
    tag_info{dicom_tag{0x0020, 0x1040}, VR::LO, "PositionReferenceIndicator", "Position Reference Indicator"},
    tag_info{dicom_tag{0x0020, 0x1041}, VR::DS, "SliceLocation", "Slice Location"},
    tag_info{dicom_tag{0x0020, 0x1200}, VR::IS, "NumberOfPatientRelatedStudies", "Number of Patient Related Studies"},
    tag_info{dicom_tag{0x0020, 0x1202}, VR::IS, "NumberOfPatientRelatedSeries", "Number of Patient Related Series"},
    tag_info{dicom_tag{0x0020, 0x1204}, VR::IS, "NumberOfPatientRelatedInstances", "Number of Patient Related Instances"},
    tag_info{dicom_tag{0x0020, 0x1206}, VR::IS, "NumberOfStudyRelatedSeries", "Number of Study Related Series"},
    tag_info{dicom_tag{0x0020, 0x1208}, VR::IS, "NumberOfStudyRelatedInstances", "Number of Study Related Instances"},
    tag_info{dicom_tag{0x0020, 0x1209}, VR::IS, "NumberOfSeriesRelatedInstances", "Number of Series Related Instances"},
    tag_info{dicom_tag{0x0020, 0x4000}, VR::LT, "ImageComments", "Image Comments"},

    // Group 0028 - Image Presentation
    tag_info{dicom_tag{0x0028, 0x0002}, VR::US, "SamplesPerPixel", "Samples per Pixel"},
    tag_info{dicom_tag{0x0028, 0x0003}, VR::US, "SamplesPerPixelUsed", "Samples per Pixel Used"},
    tag_info{dicom_tag{0x0028, 0x0004}, VR::CS, "PhotometricInterpretation", "Photometric Interpretation"},
    tag_info{dicom_tag{0x0028, 0x0006}, VR::US, "PlanarConfiguration", "Planar Configuration"},
    tag_info{dicom_tag{0x0028, 0x0008}, VR::IS, "NumberOfFrames", "Number of Frames"},
    tag_info{dicom_tag{0x0028, 0x0009}, VR::AT, "FrameIncrementPointer", "Frame Increment Pointer"},
    tag_info{dicom_tag{0x0028, 0x0010}, VR::US, "Rows", "Rows"},
    tag_info{dicom_tag{0x0028, 0x0011}, VR::US, "Columns", "Columns"},
    tag_info{dicom_tag{0x0028, 0x0030}, VR::DS, "PixelSpacing", "Pixel Spacing"},
    tag_info{dicom_tag{0x0028, 0x0034}, VR::IS, "PixelAspectRatio", "Pixel Aspect Ratio"},
    tag_info{dicom_tag{0x0028, 0x0100}, VR::US, "BitsAllocated", "Bits Allocated"},
    tag_info{dicom_tag{0x0028, 0x0101}, VR::US, "BitsStored", "Bits Stored"},
    tag_info{dicom_tag{0x0028, 0x0102}, VR::US, "HighBit", "High Bit"},
    tag_info{dicom_tag{0x0028, 0x0103}, VR::US, "PixelRepresentation", "Pixel Representation"},
    tag_info{dicom_tag{0x0028, 0x0106}, VR::US, "SmallestImagePixelValue", "Smallest Image Pixel Value"},
    tag_info{dicom_tag{0x0028, 0x0107}, VR::US, "LargestImagePixelValue", "Largest Image Pixel Value"},
    tag_info{dicom_tag{0x0028, 0x0108}, VR::US, "SmallestPixelValueInSeries", "Smallest Pixel Value in Series"},
    tag_info{dicom_tag{0x0028, 0x0109}, VR::US, "LargestPixelValueInSeries", "Largest Pixel Value in Series"},
    tag_info{dicom_tag{0x0028, 0x0120}, VR::US, "PixelPaddingValue", "Pixel Padding Value"},
    tag_info{dicom_tag{0x0028, 0x0121}, VR::US, "PixelPaddingRangeLimit", "Pixel Padding Range Limit"},
    tag_info{dicom_tag{0x0028, 0x0300}, VR::CS, "QualityControlImage", "Quality Control Image"},
    tag_info{dicom_tag{0x0028, 0x0301}, VR::CS, "BurnedInAnnotation", "Burned In Annotation"},
    tag_info{dicom_tag{0x0028, 0x1050}, VR::DS, "WindowCenter", "Window Center"},
    tag_info{dicom_tag{0x0028, 0x1051}, VR::DS, "WindowWidth", "Window Width"},
    tag_info{dicom_tag{0x0028, 0x1052}, VR::DS, "RescaleIntercept", "Rescale Intercept"},
    tag_info{dicom_tag{0x0028, 0x1053}, VR::DS, "RescaleSlope", "Rescale Slope"},
    tag_info{dicom_tag{0x0028, 0x1054}, VR::LO, "RescaleType", "Rescale Type"},
    tag_info{dicom_tag{0x0028, 0x1055}, VR::LO, "WindowCenterWidthExplanation", "Window Center & Width Explanation"},
    tag_info{dicom_tag{0x0028, 0x1056}, VR::CS, "VOILUTFunction", "VOI LUT Function"},
    tag_info{dicom_tag{0x0028, 0x1101}, VR::US, "RedPaletteColorLookupTableDescriptor", "Red Palette Color Lookup Table Descriptor"},
    tag_info{dicom_tag{0x0028, 0x1102}, VR::US, "GreenPaletteColorLookupTableDescriptor", "Green Palette Color Lookup Table Descriptor"},
    tag_info{dicom_tag{0x0028, 0x1103}, VR::US, "BluePaletteColorLookupTableDescriptor", "Blue Palette Color Lookup Table Descriptor"},
    tag_info{dicom_tag{0x0028, 0x1199}, VR::UI, "PaletteColorLookupTableUID", "Palette Color Lookup Table UID"},
    tag_info{dicom_tag{0x0028, 0x1201}, VR::OW, "RedPaletteColorLookupTableData", "Red Palette Color Lookup Table Data"},
    tag_info{dicom_tag{0x0028, 0x1202}, VR::OW, "GreenPaletteColorLookupTableData", "Green Palette Color Lookup Table Data"},
    tag_info{dicom_tag{0x0028, 0x1203}, VR::OW, "BluePaletteColorLookupTableData", "Blue Palette Color Lookup Table Data"},
    tag_info{dicom_tag{0x0028, 0x2110}, VR::CS, "LossyImageCompression", "Lossy Image Compression"},
    tag_info{dicom_tag{0x0028, 0x2112}, VR::DS, "LossyImageCompressionRatio", "Lossy Image Compression Ratio"},
    tag_info{dicom_tag{0x0028, 0x2114}, VR::CS, "LossyImageCompressionMethod", "Lossy Image Compression Method"},
    tag_info{dicom_tag{0x0028, 0x3000}, VR::SQ, "ModalityLUTSequence", "Modality LUT Sequence"},
    tag_info{dicom_tag{0x0028, 0x3010}, VR::SQ, "VOILUTSequence", "VOI LUT Sequence"},

    // Group 0040 - Procedure Step
    tag_info{dicom_tag{0x0040, 0x0008}, VR::SQ, "ScheduledProtocolCodeSequence", "Scheduled Protocol Code Sequence"},
    tag_info{dicom_tag{0x0040, 0x000A}, VR::SQ, "StageCodeSequence", "Stage Code Sequence"},
    tag_info{dicom_tag{0x0040, 0x000B}, VR::SQ, "ScheduledPerformingPhysicianIdentificationSequence", "Scheduled Performing Physician Identification Sequence"},
    tag_info{dicom_tag{0x0040, 0x0100}, VR::SQ, "ScheduledProcedureStepSequence", "Scheduled Procedure Step Sequence"},
    tag_info{dicom_tag{0x0040, 0x0220}, VR::SQ, "ReferencedNonImageCompositeSOPInstanceSequence", "Referenced Non-Image Composite SOP Instance Sequence"},
    tag_info{dicom_tag{0x0040, 0x0260}, VR::SQ, "PerformedProtocolCodeSequence", "Performed Protocol Code Sequence"},
    tag_info{dicom_tag{0x0040, 0x0270}, VR::SQ, "ScheduledStepAttributesSequence", "Scheduled Step Attributes Sequence"},
    tag_info{dicom_tag{0x0040, 0x0275}, VR::SQ, "RequestAttributesSequence", "Request Attributes Sequence"},
    tag_info{dicom_tag{0x0040, 0x0340}, VR::SQ, "PerformedSeriesSequence", "Performed Series Sequence"},
    tag_info{dicom_tag{0x0040, 0x100A}, VR::SQ, "ReasonForRequestedProcedureCodeSequence", "Reason for Requested Procedure Code Sequence"},
    tag_info{dicom_tag{0x0040, 0x1011}, VR::SQ, "IntendedRecipientsOfResultsIdentificationSequence", "Intended Recipients of Results Identification Sequence"},
    tag_info{dicom_tag{0x0040, 0x1012}, VR::SQ, "ReasonForPerformedProcedureCodeSequence", "Reason For Performed Procedure Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA043}, VR::SQ, "ConceptNameCodeSequence", "Concept Name Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA073}, VR::SQ, "VerifyingObserverSequence", "Verifying Observer Sequence"},
    tag_info{dicom_tag{0x0040, 0xA088}, VR::SQ, "VerifyingObserverIdentificationCodeSequence", "Verifying Observer Identification Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA168}, VR::SQ, "ConceptCodeSequence", "Concept Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA170}, VR::SQ, "PurposeOfReferenceCodeSequence", "Purpose of Reference Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA195}, VR::SQ, "ModifierCodeSequence", "Modifier Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA300}, VR::SQ, "MeasuredValueSequence", "Measured Value Sequence"},
    tag_info{dicom_tag{0x0040, 0xA360}, VR::SQ, "PredecessorDocumentsSequence", "Predecessor Documents Sequence"},
    tag_info{dicom_tag{0x0040, 0xA370}, VR::SQ, "ReferencedRequestSequence", "Referenced Request Sequence"},
    tag_info{dicom_tag{0x0040, 0xA372}, VR::SQ, "PerformedProcedureCodeSequence", "Performed Procedure Code Sequence"},
    tag_info{dicom_tag{0x0040, 0xA375}, VR::SQ, "CurrentRequestedProcedureEvidenceSequence", "Current Requested Procedure Evidence Sequence"},
    tag_info{dicom_tag{0x0040, 0xA385}, VR::SQ, "PertinentOtherEvidenceSequence", "Pertinent Other Evidence Sequence"},
    tag_info{dicom_tag{0x0040, 0xA390}, VR::SQ, "HL7StructuredDocumentReferenceSequence", "HL7 Structured Document Reference Sequence"},
    tag_info{dicom_tag{0x0040, 0xA504}, VR::SQ, "ContentTemplateSequence", "Content Template Sequence"},
    tag_info{dicom_tag{0x0040, 0xA525}, VR::SQ, "IdenticalDocumentsSequence", "Identical Documents Sequence"},
    tag_info{dicom_tag{0x0040, 0xA730}, VR::SQ, "ContentSequence", "Content Sequence"},

    // Group 0050 - Device
    tag_info{dicom_tag{0x0050, 0x0010}, VR::SQ, "DeviceSequence", "Device Sequence"},

    // Group 7FE0 - Pixel Data
    tag_info{dicom_tag{0x7FE0, 0x0001}, VR::OV, "ExtendedOffsetTable", "Extended Offset Table"},
    tag_info{dicom_tag{0x7FE0, 0x0002}, VR::OV, "ExtendedOffsetTableLengths", "Extended Offset Table Lengths"},
    tag_info{dicom_tag{0x7FE0, 0x0008}, VR::OF, "FloatPixelData", "Float Pixel Data"},
    tag_info{dicom_tag{0x7FE0, 0x0009}, VR::OD, "DoubleFloatPixelData", "Double Float Pixel Data"},
    tag_info{dicom_tag{0x7FE0, 0x0010}, VR::OW, "PixelData", "Pixel Data"},
};
// clang-format on

auto dictionary_table() -> std::span<const tag_info> {
    return dictionary_entries;
}

}  // namespace dcmwire::core
