#ifndef QFAT_INTERNAL_CONSTANTS_H
#define QFAT_INTERNAL_CONSTANTS_H

// ============================================================================
// Sector constants
// ============================================================================
#define FAT_SECTOR_SIZE 512
#define FAT_BOOT_SIGNATURE_OFFSET 0x1FE
#define FAT_BOOT_SIGNATURE_LOW 0x55
#define FAT_BOOT_SIGNATURE_HIGH 0xAA

// ============================================================================
// Master Boot Record constants
// ============================================================================
#define MBR_PARTITION_TABLE_OFFSET 0x1BE
#define MBR_PARTITION_ENTRY_SIZE 16
#define MBR_PARTITION_COUNT 4
#define MBR_PARTITION_TYPE_OFFSET 0x04
#define MBR_PARTITION_START_LBA_OFFSET 0x08
#define MBR_PARTITION_SECTOR_COUNT_OFFSET 0x0C

#define BOOT_JUMP_SHORT 0xEB
#define BOOT_JUMP_NOP 0x90
#define BOOT_JUMP_NEAR 0xE9

// ============================================================================
// FAT BIOS Parameter Block constants
// ============================================================================
#define BPB_BYTES_PER_SECTOR_OFFSET 0x0B
#define BPB_SECTORS_PER_CLUSTER_OFFSET 0x0D
#define BPB_RESERVED_SECTORS_OFFSET 0x0E
#define BPB_NUMBER_OF_FATS_OFFSET 0x10
#define BPB_ROOT_ENTRY_COUNT_OFFSET 0x11
#define BPB_TOTAL_SECTORS_16_OFFSET 0x13
#define BPB_SECTORS_PER_FAT_OFFSET 0x16
#define BPB_TOTAL_SECTORS_32_OFFSET 0x20
#define BPB_SECTORS_PER_FAT32_OFFSET 0x24
#define BPB_ROOT_DIRECTORY_CLUSTER_OFFSET 0x2C
#define BPB_EXTENDED_SIGNATURE_OFFSET 0x42
#define BPB_VOLUME_LABEL_OFFSET 0x47
#define BPB_VOLUME_LABEL_LENGTH 11

#define BPB_EXTENDED_SIGNATURE 0x29
#define BPB_MIN_BYTES_PER_SECTOR 512
#define BPB_MAX_BYTES_PER_SECTOR 4096
#define BPB_MAX_SECTORS_PER_CLUSTER 128

// Smallest cluster count that makes a volume FAT32
#define FAT32_MIN_CLUSTERS 65525

// ============================================================================
// FAT32 table constants
// ============================================================================
#define FAT32_ENTRY_SIZE 4
#define FAT32_ENTRY_MASK 0x0FFFFFFF
#define FAT32_FIRST_DATA_CLUSTER 2
#define FAT32_BAD_CLUSTER 0x0FFFFFF7
#define FAT32_END_OF_CHAIN_MIN 0x0FFFFFF8

// ============================================================================
// Entry constants
// ============================================================================
#define ENTRY_SIZE 32 // 32 bytes per entry

#define ENTRY_END_OF_DIRECTORY 0x00
#define ENTRY_DELETED 0xE5
#define ENTRY_KANJI_E5 0x05
#define ENTRY_CURRENT_DIRECTORY 0x2E

#define ENTRY_NAME_OFFSET 0x00
#define ENTRY_NAME_LENGTH 11
#define ENTRY_BASE_NAME_LENGTH 8
#define ENTRY_ATTRIBUTE_OFFSET 0x0B
#define ENTRY_NT_FLAGS_OFFSET 0x0C
#define ENTRY_HIGH_ORDER_CLUSTER_ADDRESS_OFFSET 0x14
#define ENTRY_WRITTEN_DATE_TIME_OFFSET 0x16
#define ENTRY_CLUSTER_OFFSET 0x1A
#define ENTRY_SIZE_OFFSET 0x1C

#define ENTRY_ATTRIBUTE_READ_ONLY 0x01
#define ENTRY_ATTRIBUTE_HIDDEN 0x02
#define ENTRY_ATTRIBUTE_SYSTEM 0x04
#define ENTRY_ATTRIBUTE_VOLUME_LABEL 0x08
#define ENTRY_ATTRIBUTE_DIRECTORY 0x10
#define ENTRY_ATTRIBUTE_ARCHIVE 0x20
#define ENTRY_ATTRIBUTE_LONG_FILE_NAME 0x0F
#define ENTRY_ATTRIBUTE_LONG_FILE_NAME_MASK 0x3F

// Windows NT case flags for names stored without LFN records
#define ENTRY_NT_LOWERCASE_BASE 0x08
#define ENTRY_NT_LOWERCASE_EXT 0x10

#define ENTRY_DATE_TIME_START_OF_YEAR 1980

// 0x0 (1B): sequence number, starting at 1, not 0; last one is ORed with 0x40
#define ENTRY_LFN_SEQUENCE_START 1
#define ENTRY_LFN_SEQUENCE_MASK 0x1F
#define ENTRY_LFN_SEQUENCE_LAST_MASK 0x40
#define ENTRY_LFN_MAX_RECORDS 20
#define ENTRY_LFN_CHARS 13 // 13 characters per part
#define ENTRY_LFN_CHECKSUM_OFFSET 0x0D
#define ENTRY_LFN_PART1_OFFSET 0x01
#define ENTRY_LFN_PART1_LENGTH 10
#define ENTRY_LFN_PART2_OFFSET 0x0E
#define ENTRY_LFN_PART2_LENGTH 12
#define ENTRY_LFN_PART3_OFFSET 0x1C
#define ENTRY_LFN_PART3_LENGTH 4

// ============================================================================
// SD card SPI-mode constants
// ============================================================================
#define SD_CMD_GO_IDLE_STATE 0
#define SD_CMD_SEND_IF_COND 8
#define SD_CMD_SEND_CSD 9
#define SD_CMD_SET_BLOCKLEN 16
#define SD_CMD_READ_SINGLE_BLOCK 17
#define SD_CMD_APP_CMD 55
#define SD_CMD_READ_OCR 58
#define SD_ACMD_SD_SEND_OP_COND 41

#define SD_COMMAND_START 0x40
#define SD_COMMAND_LENGTH 6
#define SD_IF_COND_PATTERN 0x1AA
#define SD_IF_COND_CHECK 0xAA
#define SD_IF_COND_VOLTAGE 0x01
#define SD_OCR_CCS 0x40000000
#define SD_ACMD41_HCS 0x40000000

#define SD_R1_READY 0x00
#define SD_R1_IDLE 0x01
#define SD_R1_ILLEGAL_COMMAND 0x04
#define SD_R1_INVALID_MASK 0x80

#define SD_DATA_START_TOKEN 0xFE
#define SD_ERROR_TOKEN_MASK 0xF0
#define SD_IDLE_BYTE 0xFF
#define SD_CSD_LENGTH 16

#define SD_INIT_CLOCK_HZ 400000
#define SD_INIT_IDLE_BYTES 10 // 80 clocks, at least 74 required
#define SD_GO_IDLE_ATTEMPTS 10
#define SD_OP_COND_ATTEMPTS 200
#define SD_RESPONSE_POLL_BYTES 10
#define SD_READY_POLL_BYTES 512
#define SD_TOKEN_POLL_BYTES 4096
#define SD_READ_ATTEMPTS 3

// ============================================================================
// Request handler constants
// ============================================================================
#define QFAT_MAX_HEADER_LINE 256
#define QFAT_MAX_HEADER_BYTES 2048

// ============================================================================
// Helper masks
// ============================================================================
#define MASK_1_BIT 0x01
#define MASK_2_BITS 0x03
#define MASK_4_BITS 0x0F
#define MASK_5_BITS 0x1F
#define MASK_6_BITS 0x3F
#define MASK_7_BITS 0x7F
#define MASK_8_BITS 0xFF

#endif
